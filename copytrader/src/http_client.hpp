#pragma once

#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Serialized JSON-over-HTTP client on a single curl handle.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 8000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throw TransportError on network failure, non-2xx status or unparseable body
    nlohmann::json post_json(const std::string& url, const nlohmann::json& body);
    nlohmann::json get_json(const std::string& url);

private:
    nlohmann::json perform(const std::string& url, const std::string* body);

    int timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
