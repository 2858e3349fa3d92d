#pragma once

#include "connection_pool.hpp"
#include <memory>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // JSON POST. Throws TransportError when no response was received.
    virtual HttpResponse post(const std::string& url, const std::string& body, int timeout_ms) = 0;

    // Drops kept-alive connections to the host of url.
    virtual void close_idle(const std::string& url) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::shared_ptr<ConnectionPool> pool);

    HttpResponse post(const std::string& url, const std::string& body, int timeout_ms) override;
    void close_idle(const std::string& url) override;

private:
    std::shared_ptr<ConnectionPool> pool_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
