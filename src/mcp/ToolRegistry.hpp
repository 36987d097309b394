#pragma once

#include "core/ApiClient.hpp"
#include "mcp/Protocol.hpp"
#include <functional>
#include <string>
#include <vector>

namespace gitea_mcp {

/**
 * @brief Function signature for tool execution
 * @param client REST client the handler issues its call through
 * @param args Resolved argument object
 * @return Decoded backend value; failures are thrown
 */
using ToolHandler = std::function<json(IApiClient& client, const json& args)>;

/**
 * @brief Insertion-ordered catalogue of tools
 *
 * Built once at startup, then shared read-only with the server.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with input schema
     * @param handler Function to execute when tool is called
     * @throws std::invalid_argument on empty name, empty handler or a name
     *         that is already registered
     */
    void register_tool(ToolInfo info, ToolHandler handler);

    /**
     * @brief Descriptors of all tools, in registration order
     */
    std::vector<ToolInfo> list() const;

    /**
     * @brief Execute a tool by name
     *
     * Handler failures are captured into a ToolResult with is_error set;
     * they never propagate.
     *
     * @throws UnknownToolError if no tool has this name
     */
    ToolResult call(IApiClient& client, const std::string& name, const json& args) const;

    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        ToolInfo info;
        ToolHandler handler;
    };

    const Entry* find(const std::string& name) const;

    std::vector<Entry> entries_;
};

} // namespace gitea_mcp
