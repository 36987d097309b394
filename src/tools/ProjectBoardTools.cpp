#include "tools/ProjectBoardTools.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

namespace gitea_mcp {

namespace {

std::string project_path(const RepoRef& repo, std::int64_t project_id) {
    return repo.path() + "/projects/" + std::to_string(project_id);
}

std::string column_path(const RepoRef& repo, const BoardPlacement& column) {
    return project_path(repo, column.project_id) + "/columns/" + std::to_string(column.column_id);
}

/// project_id and column_id of the column tools, both mandatory
BoardPlacement require_column(const ToolArgs& args) {
    BoardPlacement column{args.get_int("project_id"), args.get_int("column_id")};
    if (column.project_id == 0 || column.column_id == 0) {
        throw ValidationError("project_id and column_id are required");
    }
    return column;
}

struct ColumnFields {
    std::optional<std::string> title;
    std::optional<std::string> color;

    static ColumnFields from_args(const ToolArgs& args) {
        return {args.optional_string("title"), args.optional_string("color")};
    }

    json to_body() const {
        json body = json::object();
        if (title) body["title"] = *title;
        if (color) body["color"] = *color;
        return body;
    }
};

} // namespace

// ============================================================================
// Registration
// ============================================================================

void ProjectBoardTools::register_tools(ToolRegistry& registry) {
    registry.register_tool(
        {"list_project_columns", "List columns in a project board",
         repo_schema({{"project_id", integer_property("Project ID")}}, {"project_id"})},
        &ProjectBoardTools::list_project_columns);

    registry.register_tool(
        {"create_project_column", "Create a new column in a project board",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"title", string_property("Column title")},
             {"color", string_property("Column color (hex code)")}
         }, {"project_id", "title"})},
        &ProjectBoardTools::create_project_column);

    registry.register_tool(
        {"edit_project_column", "Edit an existing project board column",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")},
             {"title", string_property("New column title")},
             {"color", string_property("New column color (hex code)")}
         }, {"project_id", "column_id"})},
        &ProjectBoardTools::edit_project_column);

    registry.register_tool(
        {"delete_project_column", "Delete a column from a project board",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")}
         }, {"project_id", "column_id"})},
        &ProjectBoardTools::delete_project_column);

    registry.register_tool(
        {"move_project_column", "Reorder a column in a project board",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")},
             {"sorting", integer_property("New sort position")}
         }, {"project_id", "column_id", "sorting"})},
        &ProjectBoardTools::move_project_column);

    registry.register_tool(
        {"set_default_project_column", "Make a column the default column of a project board",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")}
         }, {"project_id", "column_id"})},
        &ProjectBoardTools::set_default_project_column);

    registry.register_tool(
        {"list_project_column_items", "List the issues placed in a project board column",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")}
         }, {"project_id", "column_id"})},
        &ProjectBoardTools::list_project_column_items);

    registry.register_tool(
        {"assign_project_item", "Add an issue to a project board column",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"column_id", integer_property("Column ID")},
             {"issue_id", integer_property("Issue ID (not the index number)")}
         }, {"project_id", "column_id", "issue_id"})},
        &ProjectBoardTools::assign_project_item);

    registry.register_tool(
        {"move_project_item", "Move a project board item to another column",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"item_id", integer_property("Project item ID")},
             {"column_id", integer_property("Target column ID")},
             {"sorting", integer_property("Position inside the target column")}
         }, {"project_id", "item_id", "column_id"})},
        &ProjectBoardTools::move_project_item);

    registry.register_tool(
        {"remove_project_item", "Remove an issue from a project board",
         repo_schema({
             {"project_id", integer_property("Project ID")},
             {"item_id", integer_property("Project item ID")}
         }, {"project_id", "item_id"})},
        &ProjectBoardTools::remove_project_item);
}

// ============================================================================
// Columns
// ============================================================================

json ProjectBoardTools::list_project_columns(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::int64_t project_id = tool_args.require_int("project_id");
    return client.get(project_path(repo, project_id) + "/columns");
}

json ProjectBoardTools::create_project_column(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::int64_t project_id = tool_args.require_int("project_id");
    std::string title = tool_args.require_string("title");

    auto fields = ColumnFields::from_args(tool_args);
    fields.title = title;
    return client.post(project_path(repo, project_id) + "/columns", fields.to_body());
}

json ProjectBoardTools::edit_project_column(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement column = require_column(tool_args);
    return client.patch(column_path(repo, column), ColumnFields::from_args(tool_args).to_body());
}

json ProjectBoardTools::delete_project_column(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement column = require_column(tool_args);
    client.remove(column_path(repo, column));
    return deleted_status();
}

json ProjectBoardTools::move_project_column(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement column = require_column(tool_args);
    return client.post(column_path(repo, column) + "/move", {{"sorting", tool_args.get_int("sorting")}});
}

json ProjectBoardTools::set_default_project_column(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement column = require_column(tool_args);
    return client.post(column_path(repo, column) + "/default", json::object());
}

// ============================================================================
// Items
// ============================================================================

json ProjectBoardTools::list_project_column_items(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement column = require_column(tool_args);
    return client.get(column_path(repo, column) + "/items");
}

json ProjectBoardTools::assign_project_item(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    BoardPlacement target = require_column(tool_args);

    BoardItem item;
    item.issue_id = tool_args.require_int("issue_id");
    return place_item(client, repo, target.project_id, item, target);
}

json ProjectBoardTools::move_project_item(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::int64_t project_id = tool_args.get_int("project_id");

    BoardItem item;
    item.item_id = tool_args.get_int("item_id");
    if (project_id == 0 || item.item_id == 0) {
        throw ValidationError("project_id and item_id are required");
    }

    BoardPlacement target{project_id, tool_args.require_int("column_id")};
    return place_item(client, repo, project_id, item, target, tool_args.get_int("sorting"));
}

json ProjectBoardTools::remove_project_item(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::int64_t project_id = tool_args.get_int("project_id");

    BoardItem item;
    item.item_id = tool_args.get_int("item_id");
    if (project_id == 0 || item.item_id == 0) {
        throw ValidationError("project_id and item_id are required");
    }

    return place_item(client, repo, project_id, item, BoardPlacement::none());
}

json ProjectBoardTools::place_item(IApiClient& client, const RepoRef& repo, std::int64_t project_id,
                                   const BoardItem& item, const BoardPlacement& placement,
                                   std::int64_t sorting) {
    if (placement.is_none()) {
        if (project_id == 0 || item.item_id == 0) {
            throw ValidationError("project_id and item_id are required");
        }
        spdlog::debug("Removing item {} from project {}", item.item_id, project_id);
        client.remove(project_path(repo, project_id) + "/items/" + std::to_string(item.item_id));
        return deleted_status();
    }

    if (placement.project_id == 0 || placement.column_id == 0) {
        throw ValidationError("project_id and column_id are required");
    }

    if (item.item_id != 0) {
        if (placement.project_id != project_id) {
            throw ValidationError("items can only be moved within their own project");
        }
        spdlog::debug("Moving item {} to column {}", item.item_id, placement.column_id);
        return client.post(
            project_path(repo, project_id) + "/items/" + std::to_string(item.item_id) + "/move",
            {{"column_id", placement.column_id}, {"sorting", sorting}});
    }

    if (item.issue_id == 0) {
        throw ValidationError("issue_id is required");
    }
    spdlog::debug("Assigning issue {} to column {}", item.issue_id, placement.column_id);
    return client.post(column_path(repo, placement) + "/items", {{"issue_id", item.issue_id}});
}

} // namespace gitea_mcp
