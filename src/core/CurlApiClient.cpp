#include "core/CurlApiClient.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace gitea_mcp {

namespace {

constexpr const char* kApiRoot = "/api/v1";

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

/**
 * @brief RAII owner of a CURL easy handle
 */
class EasyHandle {
public:
    EasyHandle() : handle_(curl_easy_init()) {
        if (!handle_) {
            throw HttpError("curl_easy_init failed");
        }
    }

    ~EasyHandle() {
        curl_easy_cleanup(handle_);
    }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const { return handle_; }

private:
    CURL* handle_;
};

/**
 * @brief RAII owner of a curl_slist header list
 */
class HeaderList {
public:
    HeaderList() = default;

    ~HeaderList() {
        curl_slist_free_all(list_);
    }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) {
        curl_slist* next = curl_slist_append(list_, header.c_str());
        if (!next) {
            throw HttpError("curl_slist_append failed");
        }
        list_ = next;
    }

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

} // namespace

CurlApiClient::CurlApiClient(ApiClientOptions options)
    : options_(std::move(options)) {
    if (options_.base_url.empty()) {
        throw std::invalid_argument("Base URL cannot be empty");
    }
    if (options_.token.empty()) {
        throw std::invalid_argument("Token cannot be empty");
    }
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
    ensure_curl_initialized();
    spdlog::debug("CurlApiClient initialized for {}", options_.base_url);
}

json CurlApiClient::get(const std::string& path, const QueryParams& query) {
    return send("GET", path, query, std::nullopt);
}

json CurlApiClient::post(const std::string& path, const json& body) {
    return send("POST", path, {}, body);
}

json CurlApiClient::patch(const std::string& path, const json& body) {
    return send("PATCH", path, {}, body);
}

void CurlApiClient::remove(const std::string& path) {
    send("DELETE", path, {}, std::nullopt);
}

std::string CurlApiClient::build_url(const std::string& path, const QueryParams& query) const {
    std::string url = options_.base_url + kApiRoot + path;
    if (!query.empty()) {
        url += "?" + encode_query(query);
    }
    return url;
}

json CurlApiClient::decode_response(const HttpResponse& response) {
    if (response.status >= 400) {
        throw ApiError(response.status, response.body);
    }

    // 204 No Content (DELETE and friends) carries no body
    if (response.status == 204 || response.body.empty()) {
        return nullptr;
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw Error(std::string("unmarshal response: ") + e.what());
    }
}

json CurlApiClient::send(const char* method, const std::string& path, const QueryParams& query,
                         const std::optional<json>& body) {
    std::optional<std::string> payload;
    if (body) {
        payload = body->dump();
    }

    HttpResponse response;
    try {
        response = perform(method, build_url(path, query), payload);
    } catch (const HttpError& e) {
        throw HttpError(std::string("request ") + method + " " + path + ": " + e.what());
    }

    spdlog::debug("{} {} -> {}", method, path, response.status);
    return decode_response(response);
}

HttpResponse CurlApiClient::perform(const char* method, const std::string& url,
                                    const std::optional<std::string>& payload) {
    EasyHandle curl;
    HeaderList headers;
    headers.append("Authorization: Bearer " + options_.token);
    headers.append("Accept: application/json");
    headers.append(std::string("User-Agent: gitea-mcp/") + kServerVersion);
    if (payload) {
        headers.append("Content-Type: application/json");
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, options_.timeout_ms > 0 ? options_.timeout_ms : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);

    if (std::strcmp(method, "GET") == 0) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method);
    }
    if (payload) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw HttpError(curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace gitea_mcp
