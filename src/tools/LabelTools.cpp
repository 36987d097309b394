#include "tools/LabelTools.hpp"
#include "tools/ToolArgs.hpp"
#include "core/Errors.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace gitea_mcp {

namespace {

struct LabelParams {
    RepoRef repo;
    std::string name;
    std::string color;
    std::optional<std::string> description;

    static LabelParams from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        LabelParams params{std::move(repo), args.get_string("name"), args.get_string("color"),
                           args.optional_string("description")};
        if (params.name.empty() || params.color.empty()) {
            throw ValidationError("name and color are required");
        }
        return params;
    }

    json to_body() const {
        json body = {{"name", name}, {"color", color}};
        if (description) body["description"] = *description;
        return body;
    }
};

struct EditLabelParams {
    RepoRef repo;
    std::int64_t id = 0;
    std::optional<std::string> name;
    std::optional<std::string> color;
    std::optional<std::string> description;

    static EditLabelParams from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        std::int64_t id = args.require_int("id");
        return {std::move(repo), id, args.optional_string("name"), args.optional_string("color"),
                args.optional_string("description")};
    }

    json to_body() const {
        json body = json::object();
        if (name) body["name"] = *name;
        if (color) body["color"] = *color;
        if (description) body["description"] = *description;
        return body;
    }
};

std::string labels_path(const RepoRef& repo) {
    return repo.path() + "/labels";
}

} // namespace

void LabelTools::register_tools(ToolRegistry& registry) {
    registry.register_tool(
        {"list_labels", "List labels in a repository",
         repo_schema({
             {"page", integer_property("Page number")},
             {"limit", integer_property("Page size")}
         })},
        &LabelTools::list_labels);

    registry.register_tool(
        {"get_label", "Get a single label by ID or name",
         repo_schema({{"id", string_property("Label ID or name")}}, {"id"})},
        &LabelTools::get_label);

    registry.register_tool(
        {"create_label", "Create a new label in a repository",
         repo_schema({
             {"name", string_property("Label name")},
             {"color", string_property("Label color (hex code, e.g. '#00aabb')")},
             {"description", string_property("Label description")}
         }, {"name", "color"})},
        &LabelTools::create_label);

    registry.register_tool(
        {"edit_label", "Edit an existing label",
         repo_schema({
             {"id", integer_property("Label ID")},
             {"name", string_property("New label name")},
             {"color", string_property("New label color (hex code)")},
             {"description", string_property("New label description")}
         }, {"id"})},
        &LabelTools::edit_label);

    registry.register_tool(
        {"delete_label", "Delete a label from a repository",
         repo_schema({{"id", integer_property("Label ID")}}, {"id"})},
        &LabelTools::delete_label);
}

json LabelTools::list_labels(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    QueryParams query;
    tool_args.pagination().apply(query);
    return client.get(labels_path(repo), query);
}

json LabelTools::get_label(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::string id = tool_args.require_id_or_name("id");
    return client.get(labels_path(repo) + "/" + url_encode(id));
}

json LabelTools::create_label(IApiClient& client, const json& args) {
    auto params = LabelParams::from_args(ToolArgs(args));
    return client.post(labels_path(params.repo), params.to_body());
}

json LabelTools::edit_label(IApiClient& client, const json& args) {
    auto params = EditLabelParams::from_args(ToolArgs(args));
    return client.patch(labels_path(params.repo) + "/" + std::to_string(params.id), params.to_body());
}

json LabelTools::delete_label(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    RepoRef repo = tool_args.repo_ref();
    std::int64_t id = tool_args.require_int("id");
    client.remove(labels_path(repo) + "/" + std::to_string(id));
    return deleted_status();
}

} // namespace gitea_mcp
