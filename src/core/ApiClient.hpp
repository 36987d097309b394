#pragma once

#include <map>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/// Query string parameters; keys are encoded in sorted order.
using QueryParams = std::map<std::string, std::string>;

/**
 * @brief Abstract client for the Gitea REST API
 *
 * Paths are relative to the API root (e.g. "/repos/acme/widgets/labels").
 * Implementations attach authentication, encode bodies as JSON and decode
 * JSON responses. A bodiless success decodes to a null value.
 */
class IApiClient {
public:
    virtual ~IApiClient() = default;

    /**
     * @brief GET a resource
     * @param path API-root-relative path
     * @param query Query parameters (omitted from the URL when empty)
     * @return Decoded response body, or null for an empty body
     * @throws ApiError on HTTP status >= 400, HttpError on network failure
     */
    virtual json get(const std::string& path, const QueryParams& query = {}) = 0;

    /**
     * @brief POST a JSON body
     */
    virtual json post(const std::string& path, const json& body) = 0;

    /**
     * @brief PATCH with a JSON body
     */
    virtual json patch(const std::string& path, const json& body) = 0;

    /**
     * @brief DELETE a resource
     * @throws ApiError on HTTP status >= 400, HttpError on network failure
     */
    virtual void remove(const std::string& path) = 0;
};

/**
 * @brief Percent-encode everything except RFC 3986 unreserved characters
 */
std::string url_encode(std::string_view value);

/**
 * @brief Encode query parameters as "a=1&b=x%20y", keys in sorted order
 */
std::string encode_query(const QueryParams& query);

} // namespace gitea_mcp
