#pragma once

#include "core/ApiClient.hpp"
#include "mcp/ToolRegistry.hpp"
#include "tools/ToolArgs.hpp"
#include <cstdint>

namespace gitea_mcp {

/**
 * @brief Where an issue sits on a project board
 *
 * {0, 0} is the "no board" placement: applying it removes the item.
 */
struct BoardPlacement {
    std::int64_t project_id = 0;
    std::int64_t column_id = 0;

    static BoardPlacement none() { return {}; }
    bool is_none() const { return project_id == 0 && column_id == 0; }
};

/**
 * @brief Issue being placed; an existing item is known by item_id, a new
 *        one by issue_id
 */
struct BoardItem {
    std::int64_t item_id = 0;
    std::int64_t issue_id = 0;
};

/**
 * @brief Tools for project board columns and the issues placed on them
 */
class ProjectBoardTools {
public:
    static void register_tools(ToolRegistry& registry);

    // Columns
    static json list_project_columns(IApiClient& client, const json& args);
    static json create_project_column(IApiClient& client, const json& args);
    static json edit_project_column(IApiClient& client, const json& args);
    static json delete_project_column(IApiClient& client, const json& args);
    static json move_project_column(IApiClient& client, const json& args);
    static json set_default_project_column(IApiClient& client, const json& args);

    // Items
    static json list_project_column_items(IApiClient& client, const json& args);
    static json assign_project_item(IApiClient& client, const json& args);
    static json move_project_item(IApiClient& client, const json& args);
    static json remove_project_item(IApiClient& client, const json& args);

    /**
     * @brief Apply a placement to a board item
     *
     * A new item (issue_id only) is added to the target column, an existing
     * item is moved to it, and the "no board" placement removes the item
     * from project_id.
     *
     * @param project_id Project the item currently belongs to
     * @param sorting Position inside the target column when moving
     * @throws ValidationError if the item cannot be addressed for the case
     */
    static json place_item(IApiClient& client, const RepoRef& repo, std::int64_t project_id,
                           const BoardItem& item, const BoardPlacement& placement,
                           std::int64_t sorting = 0);
};

} // namespace gitea_mcp
