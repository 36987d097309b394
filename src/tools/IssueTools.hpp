#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ToolRegistry.hpp"

namespace gitea_mcp {

/**
 * @brief Tools for issues and issue comments
 *
 * Every handler takes the resolved argument object (owner/repo already
 * defaulted) and returns the backend's decoded response.
 */
class IssueTools {
public:
    /**
     * @brief Register all issue tools in catalogue order
     */
    static void register_tools(ToolRegistry& registry);

    static json list_issues(IApiClient& client, const json& args);
    static json get_issue(IApiClient& client, const json& args);
    static json create_issue(IApiClient& client, const json& args);
    static json edit_issue(IApiClient& client, const json& args);

    static json list_issue_comments(IApiClient& client, const json& args);
    static json create_issue_comment(IApiClient& client, const json& args);
    static json edit_issue_comment(IApiClient& client, const json& args);
    static json delete_issue_comment(IApiClient& client, const json& args);
};

} // namespace gitea_mcp
