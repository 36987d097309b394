#include "core/Config.hpp"
#include "core/CurlApiClient.hpp"
#include "core/Errors.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/AllTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    gitea_mcp::MCPServer* global_server = nullptr;

    // Only async-signal-safe work here: no logging. A second signal gets the
    // default action, which ends a server blocked on an idle read.
    void signal_handler(int signal) {
        std::signal(signal, SIG_DFL);
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    // stdout carries the protocol, so logs go to stderr or a file
    void setup_logging(const gitea_mcp::ServerConfig& config) {
        std::shared_ptr<spdlog::logger> logger;
        if (config.log_file.empty()) {
            logger = spdlog::stderr_color_mt("gitea-mcp");
        } else {
            logger = spdlog::basic_logger_mt("gitea-mcp", config.log_file);
            logger->flush_on(spdlog::level::info);
        }
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"MCP Stdio Server - Gitea issues, labels, milestones and project boards"};

    gitea_mcp::ServerConfig config;
    app.add_option("--url", config.base_url, "Gitea instance URL")->envname("GITEA_URL");
    app.add_option("--token", config.token, "Gitea access token")->envname("GITEA_TOKEN");
    app.add_option("--owner", config.default_owner, "Default repository owner")
        ->envname("GITEA_OWNER");
    app.add_option("--repo", config.default_repo, "Default repository name")
        ->envname("GITEA_REPO");
    app.add_option("-l,--log-level", config.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("GITEA_MCP_LOG_LEVEL")
        ->default_val("info");
    app.add_option("--log-file", config.log_file, "Write logs to this file instead of stderr")
        ->envname("GITEA_MCP_LOG_FILE");

    long timeout_seconds = 30;
    app.add_option("--timeout", timeout_seconds, "HTTP request timeout in seconds (0 disables it)")
        ->envname("GITEA_MCP_TIMEOUT")
        ->default_val(30);
    app.add_option("--max-message-size", config.max_message_bytes, "Maximum JSON-RPC message size in bytes")
        ->default_val(gitea_mcp::kDefaultMaxMessageBytes);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "gitea-mcp version " << gitea_mcp::kServerVersion << std::endl;
        return 0;
    }

    config.timeout_ms = timeout_seconds * 1000;

    try {
        config.validate();
    } catch (const gitea_mcp::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        setup_logging(config);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting gitea-mcp {}", gitea_mcp::kServerVersion);
    spdlog::info("Gitea URL: {}", config.base_url);
    if (!config.default_owner.empty() || !config.default_repo.empty()) {
        spdlog::info("Default repository: {}/{}", config.default_owner, config.default_repo);
    }

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        gitea_mcp::ApiClientOptions options;
        options.base_url = config.base_url;
        options.token = config.token;
        options.timeout_ms = config.timeout_ms;

        auto client = std::make_shared<gitea_mcp::CurlApiClient>(options);
        auto registry = gitea_mcp::build_default_registry();
        auto transport = std::make_unique<gitea_mcp::StdioTransport>(
            std::cin, std::cout, config.max_message_bytes);

        auto server = std::make_unique<gitea_mcp::MCPServer>(
            std::move(transport), registry, client,
            gitea_mcp::ArgumentResolver(config.default_owner, config.default_repo));

        // Store global reference for signal handler
        global_server = server.get();

        spdlog::info("{} tools registered, starting server", registry->size());

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server = nullptr;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
