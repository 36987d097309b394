#include "tools/ProjectTools.hpp"
#include "tools/ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <optional>
#include <string>

namespace gitea_mcp {

namespace {

struct ProjectRef {
    RepoRef repo;
    std::int64_t id = 0;

    static ProjectRef from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        return {std::move(repo), args.require_int("id")};
    }

    std::string path() const {
        return repo.path() + "/projects/" + std::to_string(id);
    }
};

struct CreateProjectParams {
    RepoRef repo;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::int64_t> template_type;  // 0 is a valid value
    std::optional<std::int64_t> card_type;

    static CreateProjectParams from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        std::string title = args.require_string("title");
        return {
            std::move(repo),
            std::move(title),
            args.optional_string("description"),
            args.optional_int("template_type"),
            args.optional_int("card_type")
        };
    }

    json to_body() const {
        json body = {{"title", title}};
        if (description) body["description"] = *description;
        if (template_type) body["template_type"] = *template_type;
        if (card_type) body["card_type"] = *card_type;
        return body;
    }
};

struct EditProjectParams {
    ProjectRef project;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::int64_t> card_type;
    std::optional<std::string> state;

    static EditProjectParams from_args(const ToolArgs& args) {
        return {
            ProjectRef::from_args(args),
            args.optional_string("title"),
            args.optional_string("description"),
            args.optional_int("card_type"),
            args.optional_string("state")
        };
    }

    json to_body() const {
        json body = json::object();
        if (title) body["title"] = *title;
        if (description) body["description"] = *description;
        if (card_type) body["card_type"] = *card_type;
        if (state) body["state"] = *state;
        return body;
    }
};

} // namespace

void ProjectTools::register_tools(ToolRegistry& registry) {
    registry.register_tool(
        {"list_projects", "List projects in a repository",
         repo_schema({
             {"state", string_property("Filter by state", {"open", "closed", "all"})},
             {"page", integer_property("Page number")},
             {"limit", integer_property("Page size")}
         })},
        &ProjectTools::list_projects);

    registry.register_tool(
        {"get_project", "Get a single project by ID",
         repo_schema({{"id", integer_property("Project ID")}}, {"id"})},
        &ProjectTools::get_project);

    registry.register_tool(
        {"create_project", "Create a new project in a repository",
         repo_schema({
             {"title", string_property("Project title")},
             {"description", string_property("Project description")},
             {"template_type", integer_property("Project template type (0=none, 1=basic kanban, 2=bug triage)")},
             {"card_type", integer_property("Card type (0=text only, 1=images and text)")}
         }, {"title"})},
        &ProjectTools::create_project);

    registry.register_tool(
        {"edit_project", "Edit an existing project",
         repo_schema({
             {"id", integer_property("Project ID")},
             {"title", string_property("New title")},
             {"description", string_property("New description")},
             {"card_type", integer_property("Card type (0=text only, 1=images and text)")},
             {"state", string_property("New state", {"open", "closed"})}
         }, {"id"})},
        &ProjectTools::edit_project);

    registry.register_tool(
        {"delete_project", "Delete a project from a repository",
         repo_schema({{"id", integer_property("Project ID")}}, {"id"})},
        &ProjectTools::delete_project);
}

json ProjectTools::list_projects(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();

    QueryParams query;
    if (auto state = tool_args.optional_string("state")) {
        query["state"] = *state;
    }
    tool_args.pagination().apply(query);

    return client.get(repo.path() + "/projects", query);
}

json ProjectTools::get_project(IApiClient& client, const json& args) {
    auto project = ProjectRef::from_args(ToolArgs(args));
    return client.get(project.path());
}

json ProjectTools::create_project(IApiClient& client, const json& args) {
    auto params = CreateProjectParams::from_args(ToolArgs(args));
    spdlog::debug("Creating project '{}' in {}/{}", params.title, params.repo.owner, params.repo.repo);
    return client.post(params.repo.path() + "/projects", params.to_body());
}

json ProjectTools::edit_project(IApiClient& client, const json& args) {
    auto params = EditProjectParams::from_args(ToolArgs(args));
    return client.patch(params.project.path(), params.to_body());
}

json ProjectTools::delete_project(IApiClient& client, const json& args) {
    auto project = ProjectRef::from_args(ToolArgs(args));
    client.remove(project.path());
    return deleted_status();
}

} // namespace gitea_mcp
