/**
 * @file http_client.cpp
 * @brief libcurl transport.
 */

#include "http_client.hpp"

#include <curl/curl.h>
#include <iostream>
#include <memory>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

std::optional<HttpResponse> HttpClient::get(const std::string& url) const {
    return perform(url, nullptr);
}

std::optional<HttpResponse> HttpClient::post_json(const std::string& url, const nlohmann::json& payload) const {
    std::string data = payload.dump();
    return perform(url, &data);
}

std::string HttpClient::url_encode(const std::string& text) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return text;

    char* escaped = curl_easy_escape(curl.get(), text.c_str(), static_cast<int>(text.size()));
    if (!escaped) return text;
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::optional<HttpResponse> HttpClient::perform(const std::string& url, const std::string* body) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        std::cerr << "Warning: curl init failed\n";
        return std::nullopt;
    }

    HttpResponse response;
    std::unique_ptr<curl_slist, SlistDeleter> headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::cerr << "Warning: HTTP request failed: " << curl_easy_strerror(rc) << "\n";
        return std::nullopt;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
