#include "mcp/MCPServer.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "mcp/Protocol.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace gitea_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::shared_ptr<const ToolRegistry> registry,
                     std::shared_ptr<IApiClient> client,
                     ArgumentResolver resolver)
    : transport_(std::move(transport)),
      registry_(std::move(registry)),
      client_(std::move(client)),
      resolver_(std::move(resolver)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
    if (!client_) {
        throw std::invalid_argument("API client cannot be null");
    }
    spdlog::debug("MCPServer initialized with {} tools", registry_->size());
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    try {
        while (running_ && transport_->is_open()) {
            std::optional<std::string> message = transport_->read_message();
            if (!message) {
                spdlog::info("End of input, stopping server");
                break;
            }

            std::optional<json> response = handle_message(*message);
            if (response) {
                transport_->write_message(*response);
            }
        }
    } catch (const TransportError& e) {
        running_ = false;
        spdlog::error("Transport failure: {}", e.what());
        throw;
    }

    if (!running_) {
        spdlog::info("MCPServer stop requested");
    }
    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    running_ = false;
}

std::optional<json> MCPServer::handle_message(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::warn("JSON parse error: {}", e.what());
        return jsonrpc::make_error(json(), jsonrpc::kParseError, "Parse error");
    }

    // Valid JSON that is not an envelope at all has no id to recover
    if (!message.is_object()) {
        spdlog::warn("Message is not a JSON object");
        return jsonrpc::make_error(json(), jsonrpc::kParseError, "Parse error");
    }

    json id = message.value("id", json());
    if (!id.is_null() && !id.is_string() && !id.is_number()) {
        return jsonrpc::make_error(json(), jsonrpc::kInvalidRequest,
                                   "Invalid Request: id must be a string or number");
    }
    bool notification = id.is_null();

    auto version_it = message.find("jsonrpc");
    if (version_it != message.end() && *version_it != jsonrpc::kVersion) {
        if (notification) {
            return std::nullopt;
        }
        return jsonrpc::make_error(id, jsonrpc::kInvalidRequest,
                                   "Invalid Request: jsonrpc must be \"2.0\"");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (notification) {
            return std::nullopt;
        }
        return jsonrpc::make_error(id, jsonrpc::kInvalidRequest,
                                   "Invalid Request: missing or invalid method field");
    }
    std::string method = method_it->get<std::string>();

    // Notifications expect no response, whatever the method
    if (notification) {
        spdlog::debug("Received notification: {}", method);
        return std::nullopt;
    }

    return handle_request(id, method, message.value("params", json()));
}

json MCPServer::handle_request(const json& id, const std::string& method, const json& params) {
    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    try {
        if (method == "initialize") {
            return jsonrpc::make_result(id, handle_initialize(params));
        } else if (method == "tools/list") {
            return jsonrpc::make_result(id, handle_tools_list());
        } else if (method == "tools/call") {
            return handle_tools_call(id, params);
        }
        return jsonrpc::make_error(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return jsonrpc::make_error(id, jsonrpc::kInternalError,
                                   std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const json& client_info = params["clientInfo"];
        spdlog::info("Client: {} version {}",
                     client_info.value("name", "unknown"),
                     client_info.value("version", "unknown"));
    }

    return {
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {
            {"name", "gitea-mcp"},
            {"version", kServerVersion}
        }},
        {"capabilities", {
            {"tools", json::object()}
        }}
    };
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();
    for (const auto& info : registry_->list()) {
        tools_array.push_back(json(info));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& id, const json& params) {
    ToolCallParams call;
    try {
        call = ToolCallParams::parse(params);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid tools/call params: {}", e.what());
        return jsonrpc::make_error(id, jsonrpc::kInvalidParams, "Invalid tool call params");
    }

    json arguments = resolver_.resolve(call.arguments);
    spdlog::debug("Calling tool: {}", call.name);

    try {
        ToolResult result = registry_->call(*client_, call.name, arguments);
        return jsonrpc::make_result(id, result);
    } catch (const UnknownToolError& e) {
        spdlog::warn("{}", e.what());
        return jsonrpc::make_error(id, jsonrpc::kInternalError, e.what());
    }
}

} // namespace gitea_mcp
