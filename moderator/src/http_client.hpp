#pragma once

#include <string>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long status = 0;        // 0 when the transport failed before a response
    std::string body;
    std::string error;

    bool transport_ok() const { return error.empty(); }
    bool ok() const { return transport_ok() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 10000);
    virtual ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Safe to call from several threads; each call uses its own easy handle
    virtual HttpResponse post_json(const std::string& url, const nlohmann::json& payload);

private:
    int timeout_ms_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
