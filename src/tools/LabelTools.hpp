#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ToolRegistry.hpp"

namespace gitea_mcp {

/**
 * @brief Tools for repository labels
 */
class LabelTools {
public:
    static void register_tools(ToolRegistry& registry);

    static json list_labels(IApiClient& client, const json& args);
    static json get_label(IApiClient& client, const json& args);
    static json create_label(IApiClient& client, const json& args);
    static json edit_label(IApiClient& client, const json& args);
    static json delete_label(IApiClient& client, const json& args);
};

} // namespace gitea_mcp
