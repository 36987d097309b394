#include "mcp/Protocol.hpp"
#include <stdexcept>

namespace gitea_mcp {

// ============================================================================
// Envelopes
// ============================================================================

namespace jsonrpc {

json make_result(const json& id, json result) {
    json response = {{"jsonrpc", kVersion}};
    if (!id.is_null()) {
        response["id"] = id;
    }
    response["result"] = std::move(result);
    return response;
}

json make_error(const json& id, int code, const std::string& message) {
    json response = {{"jsonrpc", kVersion}};
    if (!id.is_null()) {
        response["id"] = id;
    }
    response["error"] = {
        {"code", code},
        {"message", message}
    };
    return response;
}

} // namespace jsonrpc

// ============================================================================
// Tool descriptors
// ============================================================================

bool SchemaProperty::operator==(const SchemaProperty& other) const {
    return type == other.type && description == other.description &&
           enum_values == other.enum_values;
}

bool InputSchema::operator==(const InputSchema& other) const {
    return type == other.type && properties == other.properties && required == other.required;
}

bool ToolInfo::operator==(const ToolInfo& other) const {
    return name == other.name && description == other.description &&
           input_schema == other.input_schema;
}

void to_json(json& j, const SchemaProperty& property) {
    j = {{"type", property.type}};
    if (!property.description.empty()) {
        j["description"] = property.description;
    }
    if (!property.enum_values.empty()) {
        j["enum"] = property.enum_values;
    }
}

void from_json(const json& j, SchemaProperty& property) {
    j.at("type").get_to(property.type);
    property.description = j.value("description", std::string());
    property.enum_values = j.value("enum", std::vector<std::string>());
}

void to_json(json& j, const InputSchema& schema) {
    j = {{"type", schema.type}};
    if (!schema.properties.empty()) {
        j["properties"] = schema.properties;
    }
    if (!schema.required.empty()) {
        j["required"] = schema.required;
    }
}

void from_json(const json& j, InputSchema& schema) {
    j.at("type").get_to(schema.type);
    schema.properties.clear();
    if (j.contains("properties")) {
        j.at("properties").get_to(schema.properties);
    }
    schema.required = j.value("required", std::vector<std::string>());
}

void to_json(json& j, const ToolInfo& info) {
    j = {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema}
    };
}

void from_json(const json& j, ToolInfo& info) {
    j.at("name").get_to(info.name);
    info.description = j.value("description", std::string());
    if (j.contains("inputSchema")) {
        j.at("inputSchema").get_to(info.input_schema);
    } else {
        info.input_schema = InputSchema{};
    }
}

// ============================================================================
// tools/call
// ============================================================================

ToolCallParams ToolCallParams::parse(const json& params) {
    if (!params.is_object()) {
        throw std::invalid_argument("tools/call params must be an object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw std::invalid_argument("tools/call params must carry a string name");
    }

    ToolCallParams call;
    call.name = name_it->get<std::string>();
    if (call.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    call.arguments = params.value("arguments", json());
    return call;
}

ToolResult ToolResult::text(std::string text) {
    ToolResult result;
    result.content.push_back({std::move(text)});
    return result;
}

ToolResult ToolResult::error(const std::string& message) {
    ToolResult result;
    result.content.push_back({"Error: " + message});
    result.is_error = true;
    return result;
}

void to_json(json& j, const ToolResult& result) {
    json content = json::array();
    for (const auto& item : result.content) {
        content.push_back({
            {"type", "text"},
            {"text", item.text}
        });
    }
    j = {{"content", std::move(content)}};
    if (result.is_error) {
        j["isError"] = true;
    }
}

} // namespace gitea_mcp
