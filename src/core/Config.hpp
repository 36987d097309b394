#pragma once

#include <cstddef>
#include <string>

namespace gitea_mcp {

/// Version string reported in initialize and --version.
#ifdef GITEA_MCP_VERSION
inline constexpr const char* kServerVersion = GITEA_MCP_VERSION;
#else
inline constexpr const char* kServerVersion = "0.1.0";
#endif

/// Lower bound for the framing buffer; messages of this size must always fit.
inline constexpr std::size_t kMinMessageBytes = 10 * 1000 * 1000;

/// Default framing buffer size.
inline constexpr std::size_t kDefaultMaxMessageBytes = 10 * 1024 * 1024;

/**
 * @brief Process-wide server configuration
 *
 * Filled from command-line options and environment variables in main,
 * immutable once the server starts.
 */
struct ServerConfig {
    std::string base_url;
    std::string token;
    std::string default_owner;
    std::string default_repo;

    std::string log_level = "info";
    std::string log_file;

    long timeout_ms = 30000;
    std::size_t max_message_bytes = kDefaultMaxMessageBytes;

    /**
     * @brief Check that the configuration can start a server
     * @throws ConfigError naming the first offending field
     */
    void validate() const;
};

} // namespace gitea_mcp
