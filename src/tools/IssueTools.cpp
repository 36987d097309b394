#include "tools/IssueTools.hpp"
#include "tools/ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitea_mcp {

namespace {

struct ListIssuesParams {
    RepoRef repo;
    std::optional<std::string> state;
    std::optional<std::string> labels;
    std::optional<std::string> query;
    std::optional<std::string> milestone;
    Pagination pagination;

    static ListIssuesParams from_args(const ToolArgs& args) {
        return {
            args.repo_ref(),
            args.optional_string("state"),
            args.optional_string("labels"),
            args.optional_string("q"),
            args.optional_string("milestone"),
            args.pagination()
        };
    }

    QueryParams to_query() const {
        QueryParams query_params;
        if (state) query_params["state"] = *state;
        if (labels) query_params["labels"] = *labels;
        if (query) query_params["q"] = *query;
        if (milestone) query_params["milestones"] = *milestone;
        pagination.apply(query_params);
        // Pull requests share the issues endpoint
        query_params["type"] = "issues";
        return query_params;
    }
};

struct IssueRef {
    RepoRef repo;
    std::int64_t index = 0;

    static IssueRef from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        return {std::move(repo), args.require_int("index")};
    }

    std::string path() const {
        return repo.path() + "/issues/" + std::to_string(index);
    }
};

struct CreateIssueParams {
    RepoRef repo;
    std::string title;
    std::optional<std::string> body;
    std::vector<std::string> assignees;
    std::vector<std::int64_t> labels;
    std::optional<std::int64_t> milestone;
    std::optional<std::string> due_date;

    static CreateIssueParams from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        std::string title = args.require_string("title");
        return {
            std::move(repo),
            std::move(title),
            args.optional_string("body"),
            args.get_string_list("assignees"),
            args.get_int_list("labels"),
            args.optional_positive_int("milestone"),
            args.optional_string("due_date")
        };
    }

    json to_body() const {
        json body_json = {{"title", title}};
        if (body) body_json["body"] = *body;
        if (!assignees.empty()) body_json["assignees"] = assignees;
        if (!labels.empty()) body_json["labels"] = labels;
        if (milestone) body_json["milestone"] = *milestone;
        if (due_date) body_json["due_date"] = *due_date;
        return body_json;
    }
};

struct EditIssueParams {
    IssueRef issue;
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> state;
    std::optional<std::vector<std::string>> assignees;  // Empty list clears
    std::optional<std::int64_t> milestone;              // 0 clears
    std::optional<std::string> due_date;

    static EditIssueParams from_args(const ToolArgs& args) {
        return {
            IssueRef::from_args(args),
            args.optional_string("title"),
            args.optional_string("body"),
            args.optional_string("state"),
            args.optional_string_list("assignees"),
            args.optional_int("milestone"),
            args.optional_string("due_date")
        };
    }

    json to_body() const {
        json body_json = json::object();
        if (title) body_json["title"] = *title;
        if (body) body_json["body"] = *body;
        if (state) body_json["state"] = *state;
        if (assignees) body_json["assignees"] = *assignees;
        if (milestone) body_json["milestone"] = *milestone;
        if (due_date) body_json["due_date"] = *due_date;
        return body_json;
    }
};

struct ListCommentsParams {
    IssueRef issue;
    std::optional<std::string> since;
    std::optional<std::string> before;

    static ListCommentsParams from_args(const ToolArgs& args) {
        return {IssueRef::from_args(args), args.optional_string("since"), args.optional_string("before")};
    }

    QueryParams to_query() const {
        QueryParams query;
        if (since) query["since"] = *since;
        if (before) query["before"] = *before;
        return query;
    }
};

struct CommentRef {
    RepoRef repo;
    std::int64_t id = 0;

    static CommentRef from_args(const ToolArgs& args) {
        RepoRef repo = args.repo_ref();
        return {std::move(repo), args.require_int("id")};
    }

    std::string path() const {
        return repo.path() + "/issues/comments/" + std::to_string(id);
    }
};

} // namespace

void IssueTools::register_tools(ToolRegistry& registry) {
    registry.register_tool(
        {"list_issues", "List and search issues in a repository",
         repo_schema({
             {"state", string_property("Filter by state", {"open", "closed", "all"})},
             {"labels", string_property("Comma-separated list of label names")},
             {"q", string_property("Search query")},
             {"milestone", string_property("Milestone name or ID")},
             {"page", integer_property("Page number")},
             {"limit", integer_property("Page size")}
         })},
        &IssueTools::list_issues);

    registry.register_tool(
        {"get_issue", "Get a single issue by its index number",
         repo_schema({{"index", integer_property("Issue index number")}}, {"index"})},
        &IssueTools::get_issue);

    registry.register_tool(
        {"create_issue", "Create a new issue in a repository",
         repo_schema({
             {"title", string_property("Issue title")},
             {"body", string_property("Issue body/description")},
             {"assignees", array_property("List of assignee usernames")},
             {"labels", array_property("List of label IDs")},
             {"milestone", integer_property("Milestone ID")},
             {"due_date", string_property("Due date (ISO 8601 format)")}
         }, {"title"})},
        &IssueTools::create_issue);

    registry.register_tool(
        {"edit_issue", "Edit an existing issue",
         repo_schema({
             {"index", integer_property("Issue index number")},
             {"title", string_property("New title")},
             {"body", string_property("New body/description")},
             {"state", string_property("New state", {"open", "closed"})},
             {"assignees", array_property("List of assignee usernames")},
             {"milestone", integer_property("Milestone ID (0 to clear)")},
             {"due_date", string_property("Due date (ISO 8601 format)")}
         }, {"index"})},
        &IssueTools::edit_issue);

    registry.register_tool(
        {"list_issue_comments", "List comments on an issue",
         repo_schema({
             {"index", integer_property("Issue index number")},
             {"since", string_property("Only show comments updated after this date (ISO 8601 format)")},
             {"before", string_property("Only show comments updated before this date (ISO 8601 format)")}
         }, {"index"})},
        &IssueTools::list_issue_comments);

    registry.register_tool(
        {"create_issue_comment", "Add a comment to an issue",
         repo_schema({
             {"index", integer_property("Issue index number")},
             {"body", string_property("Comment body")}
         }, {"index", "body"})},
        &IssueTools::create_issue_comment);

    registry.register_tool(
        {"edit_issue_comment", "Edit an existing comment on an issue",
         repo_schema({
             {"id", integer_property("Comment ID")},
             {"body", string_property("New comment body")}
         }, {"id", "body"})},
        &IssueTools::edit_issue_comment);

    registry.register_tool(
        {"delete_issue_comment", "Delete a comment on an issue",
         repo_schema({{"id", integer_property("Comment ID")}}, {"id"})},
        &IssueTools::delete_issue_comment);
}

json IssueTools::list_issues(IApiClient& client, const json& args) {
    auto params = ListIssuesParams::from_args(ToolArgs(args));
    return client.get(params.repo.path() + "/issues", params.to_query());
}

json IssueTools::get_issue(IApiClient& client, const json& args) {
    auto issue = IssueRef::from_args(ToolArgs(args));
    return client.get(issue.path());
}

json IssueTools::create_issue(IApiClient& client, const json& args) {
    auto params = CreateIssueParams::from_args(ToolArgs(args));
    spdlog::debug("Creating issue '{}' in {}/{}", params.title, params.repo.owner, params.repo.repo);
    return client.post(params.repo.path() + "/issues", params.to_body());
}

json IssueTools::edit_issue(IApiClient& client, const json& args) {
    auto params = EditIssueParams::from_args(ToolArgs(args));
    return client.patch(params.issue.path(), params.to_body());
}

json IssueTools::list_issue_comments(IApiClient& client, const json& args) {
    auto params = ListCommentsParams::from_args(ToolArgs(args));
    return client.get(params.issue.path() + "/comments", params.to_query());
}

json IssueTools::create_issue_comment(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    auto issue = IssueRef::from_args(tool_args);
    std::string body = tool_args.require_string("body");
    return client.post(issue.path() + "/comments", {{"body", body}});
}

json IssueTools::edit_issue_comment(IApiClient& client, const json& args) {
    ToolArgs tool_args(args);
    auto comment = CommentRef::from_args(tool_args);
    std::string body = tool_args.require_string("body");
    return client.patch(comment.path(), {{"body", body}});
}

json IssueTools::delete_issue_comment(IApiClient& client, const json& args) {
    auto comment = CommentRef::from_args(ToolArgs(args));
    client.remove(comment.path());
    return deleted_status();
}

} // namespace gitea_mcp
