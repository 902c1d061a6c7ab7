#include "http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

HttpClient::HttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw InitializationError("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json HttpClient::perform(const std::string& url, const std::string* body) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string response_string;
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw TransportError(fmt::format("Request to {} failed: {}", url, curl_easy_strerror(res)));
    }
    if (status < 200 || status >= 300) {
        throw TransportError(fmt::format("Request to {} returned HTTP {}: {}", url, status,
                                         response_string.substr(0, 256)));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(fmt::format("Failed to parse response from {}: {}", url, e.what()));
    }
}

nlohmann::json HttpClient::post_json(const std::string& url, const nlohmann::json& body) {
    std::string payload = body.dump();
    return perform(url, &payload);
}

nlohmann::json HttpClient::get_json(const std::string& url) {
    return perform(url, nullptr);
}
