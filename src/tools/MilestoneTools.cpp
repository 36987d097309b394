#include "tools/MilestoneTools.hpp"
#include "tools/ToolArgs.hpp"
#include <optional>
#include <string>

namespace gitea_mcp {

namespace {

struct MilestoneRef {
    RepoRef repo;
    std::string id;  // Numeric id or milestone name

    static MilestoneRef from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        return {std::move(repo), args.require_id_or_name("id")};
    }

    std::string path() const {
        return repo.path() + "/milestones/" + url_encode(id);
    }
};

/// Writable milestone fields shared by create and edit
struct MilestoneFields {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> due_on;
    std::optional<std::string> state;

    static MilestoneFields from_args(const ToolArgs& args) {
        return {
            args.optional_string("title"),
            args.optional_string("description"),
            args.optional_string("due_on"),
            args.optional_string("state")
        };
    }

    json to_body() const {
        json body = json::object();
        if (title) body["title"] = *title;
        if (description) body["description"] = *description;
        if (due_on) body["due_on"] = *due_on;
        if (state) body["state"] = *state;
        return body;
    }
};

} // namespace

void MilestoneTools::register_tools(ToolRegistry& registry) {
    registry.register_tool(
        {"list_milestones", "List milestones in a repository",
         repo_schema({
             {"state", string_property("Filter by state", {"open", "closed", "all"})},
             {"page", integer_property("Page number")},
             {"limit", integer_property("Page size")}
         })},
        &MilestoneTools::list_milestones);

    registry.register_tool(
        {"get_milestone", "Get a single milestone by ID or name",
         repo_schema({{"id", string_property("Milestone ID or name")}}, {"id"})},
        &MilestoneTools::get_milestone);

    registry.register_tool(
        {"create_milestone", "Create a new milestone in a repository",
         repo_schema({
             {"title", string_property("Milestone title")},
             {"description", string_property("Milestone description")},
             {"due_on", string_property("Due date (ISO 8601 format)")},
             {"state", string_property("Milestone state", {"open", "closed"})}
         }, {"title"})},
        &MilestoneTools::create_milestone);

    registry.register_tool(
        {"edit_milestone", "Edit an existing milestone",
         repo_schema({
             {"id", string_property("Milestone ID or name")},
             {"title", string_property("New title")},
             {"description", string_property("New description")},
             {"due_on", string_property("New due date (ISO 8601 format)")},
             {"state", string_property("New state", {"open", "closed"})}
         }, {"id"})},
        &MilestoneTools::edit_milestone);

    registry.register_tool(
        {"delete_milestone", "Delete a milestone from a repository",
         repo_schema({{"id", string_property("Milestone ID or name")}}, {"id"})},
        &MilestoneTools::delete_milestone);
}

json MilestoneTools::list_milestones(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();

    QueryParams query;
    if (auto state = tool_args.optional_string("state")) {
        query["state"] = *state;
    }
    tool_args.pagination().apply(query);

    return client.get(repo.path() + "/milestones", query);
}

json MilestoneTools::get_milestone(IApiClient& client, const json& args) {
    auto milestone = MilestoneRef::from_args(ToolArgs(args));
    return client.get(milestone.path());
}

json MilestoneTools::create_milestone(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::string title = tool_args.require_string("title");

    auto fields = MilestoneFields::from_args(tool_args);
    fields.title = title;
    return client.post(repo.path() + "/milestones", fields.to_body());
}

json MilestoneTools::edit_milestone(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    auto milestone = MilestoneRef::from_args(tool_args);
    return client.patch(milestone.path(), MilestoneFields::from_args(tool_args).to_body());
}

json MilestoneTools::delete_milestone(IApiClient& client, const json& args) {
    auto milestone = MilestoneRef::from_args(ToolArgs(args));
    client.remove(milestone.path());
    return deleted_status();
}

} // namespace gitea_mcp
