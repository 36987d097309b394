#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ToolRegistry.hpp"

namespace gitea_mcp {

/**
 * @brief Tools for repository projects (boards)
 *
 * Columns and items of a board are handled by ProjectBoardTools.
 */
class ProjectTools {
public:
    static void register_tools(ToolRegistry& registry);

    static json list_projects(IApiClient& client, const json& args);
    static json get_project(IApiClient& client, const json& args);
    static json create_project(IApiClient& client, const json& args);
    static json edit_project(IApiClient& client, const json& args);
    static json delete_project(IApiClient& client, const json& args);
};

} // namespace gitea_mcp
