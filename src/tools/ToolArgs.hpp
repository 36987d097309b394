#pragma once

#include "core/ApiClient.hpp"
#include "mcp/Protocol.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/**
 * @brief Repository addressed by a tool call
 */
struct RepoRef {
    std::string owner;
    std::string repo;

    /**
     * @brief API path of the repository, "/repos/{owner}/{repo}"
     */
    std::string path() const;
};

/**
 * @brief page/limit pair of list tools; zero means "not sent"
 */
struct Pagination {
    std::int64_t page = 0;
    std::int64_t limit = 0;

    void apply(QueryParams& query) const;
};

/**
 * @brief Typed view over an untyped tool argument object
 *
 * The only place where tool handlers look at raw JSON. Values of the wrong
 * JSON type read as absent; integers are taken from JSON numbers and
 * fractional parts are truncated. Numbers outside the int64 range read as
 * absent.
 */
class ToolArgs {
public:
    explicit ToolArgs(const json& args);

    /// String value, empty if absent or not a string.
    std::string get_string(const std::string& key) const;

    /// Integer value, 0 if absent or not a number.
    std::int64_t get_int(const std::string& key) const;

    /// String elements of an array; non-string elements are skipped.
    std::vector<std::string> get_string_list(const std::string& key) const;

    /// Integer elements of an array; non-number elements are skipped.
    std::vector<std::int64_t> get_int_list(const std::string& key) const;

    /// Non-empty string value.
    std::optional<std::string> optional_string(const std::string& key) const;

    /// Positive integer value.
    std::optional<std::int64_t> optional_positive_int(const std::string& key) const;

    /// Any integer value, zero included, for fields where 0 means "clear".
    std::optional<std::int64_t> optional_int(const std::string& key) const;

    /// Array value as strings, present even when empty.
    std::optional<std::vector<std::string>> optional_string_list(const std::string& key) const;

    /**
     * @brief Identifier that may be a numeric id or a textual name
     *
     * The string form wins; a positive number is rendered in decimal.
     * @return Empty string when neither form is present
     */
    std::string get_id_or_name(const std::string& key) const;

    /// @throws ValidationError "<key> is required" when empty or absent
    std::string require_string(const std::string& key) const;

    /// @throws ValidationError "<key> is required" when zero or absent
    std::int64_t require_int(const std::string& key) const;

    /// @throws ValidationError "<key> is required" when neither form is present
    std::string require_id_or_name(const std::string& key) const;

    /**
     * @brief owner and repo, after default injection
     * @throws ValidationError if either is missing
     */
    RepoRef repo_ref() const;

    Pagination pagination() const;

private:
    const json* find(const std::string& key) const;

    const json& args_;
};

/**
 * @brief Result returned by delete tools, whose backend call has no body
 */
json deleted_status();

// Schema helpers for tool descriptors

SchemaProperty string_property(std::string description, std::vector<std::string> enum_values = {});
SchemaProperty integer_property(std::string description);
SchemaProperty array_property(std::string description);

/**
 * @brief Input schema with owner/repo properties plus the given ones
 */
InputSchema repo_schema(std::map<std::string, SchemaProperty> properties,
                        std::vector<std::string> required = {});

} // namespace gitea_mcp
