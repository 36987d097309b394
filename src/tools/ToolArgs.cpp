#include "tools/ToolArgs.hpp"
#include "core/Errors.hpp"
#include <cmath>
#include <limits>

namespace gitea_mcp {

namespace {

// Bounds of int64 as doubles; both are exact powers of two.
constexpr double kMinInt64 = -9223372036854775808.0;
constexpr double kMaxInt64Exclusive = 9223372036854775808.0;

/// Integer value of a JSON number, nullopt when it does not fit in int64.
std::optional<std::int64_t> to_int(const json& value) {
    if (value.is_number_unsigned()) {
        std::uint64_t unsigned_value = value.get<std::uint64_t>();
        if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(unsigned_value);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    double number = value.get<double>();
    if (!std::isfinite(number) || number < kMinInt64 || number >= kMaxInt64Exclusive) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(number);
}

} // namespace

// ============================================================================
// RepoRef / Pagination
// ============================================================================

std::string RepoRef::path() const {
    return "/repos/" + url_encode(owner) + "/" + url_encode(repo);
}

void Pagination::apply(QueryParams& query) const {
    if (page > 0) {
        query["page"] = std::to_string(page);
    }
    if (limit > 0) {
        query["limit"] = std::to_string(limit);
    }
}

// ============================================================================
// ToolArgs
// ============================================================================

ToolArgs::ToolArgs(const json& args) : args_(args) {}

const json* ToolArgs::find(const std::string& key) const {
    if (!args_.is_object()) {
        return nullptr;
    }
    auto it = args_.find(key);
    if (it == args_.end()) {
        return nullptr;
    }
    return &*it;
}

std::string ToolArgs::get_string(const std::string& key) const {
    const json* value = find(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return {};
}

std::int64_t ToolArgs::get_int(const std::string& key) const {
    const json* value = find(key);
    if (value && value->is_number()) {
        return to_int(*value).value_or(0);
    }
    return 0;
}

std::vector<std::string> ToolArgs::get_string_list(const std::string& key) const {
    std::vector<std::string> result;
    const json* value = find(key);
    if (value && value->is_array()) {
        for (const auto& item : *value) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

std::vector<std::int64_t> ToolArgs::get_int_list(const std::string& key) const {
    std::vector<std::int64_t> result;
    const json* value = find(key);
    if (value && value->is_array()) {
        for (const auto& item : *value) {
            if (item.is_number()) {
                if (auto number = to_int(item)) {
                    result.push_back(*number);
                }
            }
        }
    }
    return result;
}

std::optional<std::string> ToolArgs::optional_string(const std::string& key) const {
    std::string value = get_string(key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> ToolArgs::optional_positive_int(const std::string& key) const {
    std::int64_t value = get_int(key);
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> ToolArgs::optional_int(const std::string& key) const {
    const json* value = find(key);
    if (!value || !value->is_number()) {
        return std::nullopt;
    }
    return to_int(*value);
}

std::optional<std::vector<std::string>> ToolArgs::optional_string_list(const std::string& key) const {
    const json* value = find(key);
    if (!value || !value->is_array()) {
        return std::nullopt;
    }
    return get_string_list(key);
}

std::string ToolArgs::get_id_or_name(const std::string& key) const {
    std::string id = get_string(key);
    if (id.empty()) {
        std::int64_t numeric = get_int(key);
        if (numeric > 0) {
            id = std::to_string(numeric);
        }
    }
    return id;
}

std::string ToolArgs::require_string(const std::string& key) const {
    std::string value = get_string(key);
    if (value.empty()) {
        throw ValidationError(key + " is required");
    }
    return value;
}

std::int64_t ToolArgs::require_int(const std::string& key) const {
    std::int64_t value = get_int(key);
    if (value == 0) {
        throw ValidationError(key + " is required");
    }
    return value;
}

std::string ToolArgs::require_id_or_name(const std::string& key) const {
    std::string value = get_id_or_name(key);
    if (value.empty()) {
        throw ValidationError(key + " is required");
    }
    return value;
}

RepoRef ToolArgs::repo_ref() const {
    RepoRef ref{get_string("owner"), get_string("repo")};
    if (ref.owner.empty() || ref.repo.empty()) {
        throw ValidationError(
            "owner and repo are required (set via parameters or GITEA_OWNER/GITEA_REPO)");
    }
    return ref;
}

Pagination ToolArgs::pagination() const {
    return {get_int("page"), get_int("limit")};
}

// ============================================================================
// Shared helpers
// ============================================================================

json deleted_status() {
    return {{"status", "deleted"}};
}

SchemaProperty string_property(std::string description, std::vector<std::string> enum_values) {
    return {"string", std::move(description), std::move(enum_values)};
}

SchemaProperty integer_property(std::string description) {
    return {"integer", std::move(description), {}};
}

SchemaProperty array_property(std::string description) {
    return {"array", std::move(description), {}};
}

InputSchema repo_schema(std::map<std::string, SchemaProperty> properties,
                        std::vector<std::string> required) {
    InputSchema schema;
    schema.properties = std::move(properties);
    schema.properties.emplace("owner", string_property("Repository owner"));
    schema.properties.emplace("repo", string_property("Repository name"));
    schema.required = std::move(required);
    return schema;
}

} // namespace gitea_mcp
