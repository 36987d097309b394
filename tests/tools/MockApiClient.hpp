#pragma once

#include "core/ApiClient.hpp"
#include <functional>
#include <string>
#include <vector>

namespace gitea_mcp {

/**
 * @brief One request seen by MockApiClient
 */
struct RecordedRequest {
    std::string method;
    std::string path;
    QueryParams query;
    json body;  // null for GET and DELETE
};

/**
 * @brief In-memory IApiClient that records requests
 *
 * Answers every request with the configured response, or lets a responder
 * decide (and throw ApiError to simulate backend refusals).
 */
class MockApiClient : public IApiClient {
public:
    using Responder = std::function<json(const RecordedRequest& request)>;

    json get(const std::string& path, const QueryParams& query = {}) override;
    json post(const std::string& path, const json& body) override;
    json patch(const std::string& path, const json& body) override;
    void remove(const std::string& path) override;

    void set_response(json response);
    void set_responder(Responder responder);

    const std::vector<RecordedRequest>& requests() const { return requests_; }
    const RecordedRequest& last_request() const { return requests_.back(); }

private:
    json record(RecordedRequest request);

    std::vector<RecordedRequest> requests_;
    json response_ = json::object();
    Responder responder_;
};

} // namespace gitea_mcp
