#include "connection_pool.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
std::once_flag curl_init_flag;
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, CURL* handle, std::string host)
    : pool_(pool), handle_(handle), host_(std::move(host)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), handle_(other.handle_), host_(std::move(other.host_)) {
    other.pool_ = nullptr;
    other.handle_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && handle_) {
        pool_->release(handle_, host_);
    }
}

ConnectionPool::ConnectionPool(const PoolLimits& limits) : limits_(limits) {
    if (limits_.max_total == 0 || limits_.max_per_host == 0) {
        throw std::invalid_argument("Connection pool limits must be positive");
    }
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    spdlog::debug("ConnectionPool created: total={}, per_host={}",
                  limits_.max_total, limits_.max_per_host);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

ConnectionPool::Lease ConnectionPool::acquire(const std::string& url) {
    std::string host = util::host_of(url);
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait(lock, [this, &host] {
        return closed_ ||
               (active_total_ < limits_.max_total &&
                active_per_host_[host] < limits_.max_per_host);
    });

    if (closed_) {
        throw std::runtime_error("Connection pool is shut down");
    }

    CURL* handle = nullptr;
    auto& bucket = idle_[host];
    if (!bucket.empty()) {
        handle = bucket.back();
        bucket.pop_back();
        idle_total_--;
        curl_easy_reset(handle);
    } else {
        // Keep the sum of active and idle handles within max_total.
        if (active_total_ + idle_total_ >= limits_.max_total) {
            evict_one_idle_locked();
        }
        handle = curl_easy_init();
        if (!handle) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPIDLE, limits_.keepalive_idle_s);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPINTVL, limits_.keepalive_interval_s);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    active_total_++;
    active_per_host_[host]++;
    return Lease(this, handle, host);
}

void ConnectionPool::release(CURL* handle, const std::string& host) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_total_--;
        active_per_host_[host]--;
        if (closed_) {
            curl_easy_cleanup(handle);
        } else {
            idle_[host].push_back(handle);
            idle_total_++;
        }
    }
    cv_.notify_all();
}

void ConnectionPool::evict_one_idle_locked() {
    for (auto& [host, handles] : idle_) {
        if (!handles.empty()) {
            curl_easy_cleanup(handles.back());
            handles.pop_back();
            idle_total_--;
            return;
        }
    }
}

size_t ConnectionPool::close_idle(const std::string& url) {
    std::string host = util::host_of(url);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = idle_.find(host);
    if (it == idle_.end()) {
        return 0;
    }
    size_t closed = it->second.size();
    for (CURL* h : it->second) {
        curl_easy_cleanup(h);
    }
    idle_total_ -= closed;
    idle_.erase(it);
    if (closed > 0) {
        spdlog::debug("Closed {} idle connections to {}", closed, host);
    }
    return closed;
}

void ConnectionPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        for (auto& [host, handles] : idle_) {
            for (CURL* h : handles) {
                curl_easy_cleanup(h);
            }
        }
        idle_.clear();
        idle_total_ = 0;
    }
    cv_.notify_all();
    spdlog::info("Connection pool closed");
}

size_t ConnectionPool::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_total_;
}

size_t ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_total_;
}

size_t ConnectionPool::idle(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = idle_.find(util::host_of(url));
    return it == idle_.end() ? 0 : it->second.size();
}
