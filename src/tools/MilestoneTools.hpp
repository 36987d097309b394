#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ToolRegistry.hpp"

namespace gitea_mcp {

/**
 * @brief Tools for repository milestones
 *
 * Milestones are addressed by numeric id or by name; both forms travel in
 * the "id" argument.
 */
class MilestoneTools {
public:
    static void register_tools(ToolRegistry& registry);

    static json list_milestones(IApiClient& client, const json& args);
    static json get_milestone(IApiClient& client, const json& args);
    static json create_milestone(IApiClient& client, const json& args);
    static json edit_milestone(IApiClient& client, const json& args);
    static json delete_milestone(IApiClient& client, const json& args);
};

} // namespace gitea_mcp
