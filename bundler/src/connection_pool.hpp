#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>

struct PoolLimits {
    size_t max_total = 100;
    size_t max_per_host = 10;
    long keepalive_idle_s = 30;
    long keepalive_interval_s = 15;
};

// Bounded set of reusable libcurl easy handles. Idle handles keep their
// connection cache so repeated calls to a host reuse the TCP/TLS session.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, CURL* handle, std::string host);
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease();

        CURL* get() const { return handle_; }

    private:
        ConnectionPool* pool_;
        CURL* handle_;
        std::string host_;
    };

    explicit ConnectionPool(const PoolLimits& limits = PoolLimits{});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Blocks while the total or per-host limit is reached.
    // Throws std::runtime_error after shutdown() or if libcurl cannot allocate a handle.
    Lease acquire(const std::string& url);

    // Frees the idle handles kept for the host of url. Leased handles are
    // unaffected and return to the pool as usual.
    size_t close_idle(const std::string& url);

    void shutdown();

    size_t in_use() const;
    size_t idle() const;
    size_t idle(const std::string& url) const;
    const PoolLimits& limits() const { return limits_; }

private:
    PoolLimits limits_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::vector<CURL*>> idle_;
    std::map<std::string, size_t> active_per_host_;
    size_t active_total_ = 0;
    size_t idle_total_ = 0;
    bool closed_ = false;

    void release(CURL* handle, const std::string& host);
    void evict_one_idle_locked();
};
