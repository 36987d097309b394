#include "mcp/ToolRegistry.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace gitea_mcp {

void ToolRegistry::register_tool(ToolInfo info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (find(info.name)) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    spdlog::debug("Registered tool: {}", info.name);
    entries_.push_back({std::move(info), std::move(handler)});
}

std::vector<ToolInfo> ToolRegistry::list() const {
    std::vector<ToolInfo> tools;
    tools.reserve(entries_.size());
    for (const auto& entry : entries_) {
        tools.push_back(entry.info);
    }
    return tools;
}

ToolResult ToolRegistry::call(IApiClient& client, const std::string& name, const json& args) const {
    const Entry* entry = find(name);
    if (!entry) {
        throw UnknownToolError(name);
    }

    json value;
    try {
        value = entry->handler(client, args);
    } catch (const std::exception& e) {
        spdlog::warn("Tool {} failed: {}", name, e.what());
        return ToolResult::error(e.what());
    }

    return ToolResult::text(value.dump(2, ' ', false, json::error_handler_t::replace));
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.info.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace gitea_mcp
