#include "http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

CurlHttpClient::CurlHttpClient(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool))
{
    if (!pool_) {
        throw ConstructionError("CurlHttpClient requires a connection pool");
    }
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body, int timeout_ms) {
    auto lease = pool_->acquire(url);
    CURL* curl = lease.get();

    std::string response_string;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, NULL);

    if (res != CURLE_OK) {
        spdlog::debug("HTTP POST {} failed: {}", url, curl_easy_strerror(res));
        throw TransportError(curl_easy_strerror(res), res == CURLE_OPERATION_TIMEDOUT);
    }

    HttpResponse resp;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(response_string);
    return resp;
}

void CurlHttpClient::close_idle(const std::string& url) {
    pool_->close_idle(url);
}
