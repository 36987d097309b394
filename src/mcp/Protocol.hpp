#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 constants and envelope builders
 */
namespace jsonrpc {

constexpr const char* kVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

/**
 * @brief Build a success response
 * @param id Request ID; omitted from the envelope when null
 */
json make_result(const json& id, json result);

/**
 * @brief Build an error response
 * @param id Request ID; omitted from the envelope when null
 */
json make_error(const json& id, int code, const std::string& message);

} // namespace jsonrpc

/// MCP revision implemented by this server.
constexpr const char* kProtocolVersion = "2025-03-26";

/**
 * @brief One property of a tool input schema
 */
struct SchemaProperty {
    std::string type;
    std::string description;
    std::vector<std::string> enum_values;

    bool operator==(const SchemaProperty& other) const;
};

/**
 * @brief Restricted JSON Schema describing a tool's arguments
 *
 * Descriptive only: the server never enforces it, handlers validate.
 */
struct InputSchema {
    std::string type = "object";
    std::map<std::string, SchemaProperty> properties;
    std::vector<std::string> required;

    bool operator==(const InputSchema& other) const;
};

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    InputSchema input_schema;

    bool operator==(const ToolInfo& other) const;
};

/**
 * @brief Decoded params of a tools/call request
 */
struct ToolCallParams {
    std::string name;
    json arguments;  // Raw value, any shape; normalized by ArgumentResolver

    /**
     * @brief Decode tools/call params
     * @throws std::invalid_argument if params is not an object or name is
     *         missing, not a string or empty
     */
    static ToolCallParams parse(const json& params);
};

/**
 * @brief Text content block of a tool result
 */
struct TextContent {
    std::string text;
};

/**
 * @brief Payload of a successful tools/call
 *
 * A failed tool run is still a successful RPC; is_error flags it.
 */
struct ToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    static ToolResult text(std::string text);
    static ToolResult error(const std::string& message);
};

void to_json(json& j, const SchemaProperty& property);
void from_json(const json& j, SchemaProperty& property);

void to_json(json& j, const InputSchema& schema);
void from_json(const json& j, InputSchema& schema);

void to_json(json& j, const ToolInfo& info);
void from_json(const json& j, ToolInfo& info);

void to_json(json& j, const ToolResult& result);

} // namespace gitea_mcp
