#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ArgumentResolver.hpp"
#include "mcp/ITransport.hpp"
#include "mcp/ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 over a line transport
 *
 * Supports methods: initialize, tools/list, tools/call.
 * Processes one message at a time; responses leave in input order.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server
     * @param transport Transport implementation (owned)
     * @param registry Tool catalogue, immutable and shareable between servers
     * @param client REST client handed to every tool handler
     * @param resolver Default owner/repo injection for tools/call
     * @throws std::invalid_argument if any pointer is null
     */
    MCPServer(std::unique_ptr<ITransport> transport,
              std::shared_ptr<const ToolRegistry> registry,
              std::shared_ptr<IApiClient> client,
              ArgumentResolver resolver);

    /**
     * @brief Start server main loop
     *
     * Blocks until end of input or stop() is called.
     *
     * @throws TransportError if reading the input stream fails or a message
     *         exceeds the maximum size
     */
    void run();

    /**
     * @brief Signal server to stop after the current message
     *
     * Only stores a lock-free flag, so it may be called from a signal handler.
     */
    void stop();

private:
    /**
     * @brief Handle one raw frame
     * @return Response envelope, or std::nullopt when nothing must be sent
     */
    std::optional<json> handle_message(const std::string& line);

    /**
     * @brief Route a request that carries an id
     */
    json handle_request(const json& id, const std::string& method, const json& params);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    /**
     * @brief Handle tools/list method
     * @return Object with the tools array in registration order
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     *
     * Returns a complete envelope because bad params and unknown tools are
     * protocol errors while failed tool runs are successful results.
     */
    json handle_tools_call(const json& id, const json& params);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<const ToolRegistry> registry_;
    std::shared_ptr<IApiClient> client_;
    ArgumentResolver resolver_;
    std::atomic<bool> running_{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "stop() must be async-signal-safe");
};

} // namespace gitea_mcp
