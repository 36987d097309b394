#pragma once

#include "core/ApiClient.hpp"
#include <optional>
#include <string>

namespace gitea_mcp {

/**
 * @brief Connection settings for CurlApiClient
 */
struct ApiClientOptions {
    std::string base_url;   // Instance root, e.g. "https://gitea.example.com"
    std::string token;      // Access token sent as a bearer credential
    long timeout_ms = 30000;  // Whole-request timeout, 0 disables it
    long connect_timeout_ms = 10000;
};

/**
 * @brief Raw outcome of one HTTP exchange
 */
struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief IApiClient backed by libcurl
 *
 * Every call is synchronous and blocks until the response arrives or the
 * configured timeout fires. One easy handle is created per request.
 */
class CurlApiClient : public IApiClient {
public:
    /**
     * @brief Construct client
     * @param options Base URL, token and timeouts
     * @throws std::invalid_argument if base URL or token is empty
     */
    explicit CurlApiClient(ApiClientOptions options);

    json get(const std::string& path, const QueryParams& query = {}) override;
    json post(const std::string& path, const json& body) override;
    json patch(const std::string& path, const json& body) override;
    void remove(const std::string& path) override;

    /**
     * @brief Build the absolute URL for an API path
     *
     * Joins the base URL (without trailing slashes), "/api/v1", the path and
     * the encoded query string.
     */
    std::string build_url(const std::string& path, const QueryParams& query = {}) const;

    /**
     * @brief Interpret a raw HTTP response
     *
     * Status >= 400 throws ApiError; 204 or an empty body yields null;
     * otherwise the body must be JSON.
     */
    static json decode_response(const HttpResponse& response);

private:
    json send(const char* method, const std::string& path, const QueryParams& query,
              const std::optional<json>& body);

    HttpResponse perform(const char* method, const std::string& url,
                         const std::optional<std::string>& payload);

    ApiClientOptions options_;
};

} // namespace gitea_mcp
