/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP client on libcurl.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief One curl easy handle per request; safe to share between threads.
 *
 * curl_global_init() must have been called by the process before use.
 */
class HttpClient {
public:
    explicit HttpClient(long timeout_seconds = 30, std::string user_agent = "itinerary-engine/1.0")
        : timeout_seconds_(timeout_seconds), user_agent_(std::move(user_agent)) {}

    /// GET; std::nullopt on transport failure (any HTTP status is returned).
    std::optional<HttpResponse> get(const std::string& url) const;

    /// POST with a JSON body.
    std::optional<HttpResponse> post_json(const std::string& url, const nlohmann::json& payload) const;

    /// Percent-encode a query parameter.
    static std::string url_encode(const std::string& text);

private:
    std::optional<HttpResponse> perform(const std::string& url, const std::string* body) const;

    long timeout_seconds_;
    std::string user_agent_;
};
