#pragma once

#include "stop_signal.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Shared recent blockhash with an optional background refresh thread.
class BlockhashCache {
public:
    using Fetcher = std::function<std::string()>;

    explicit BlockhashCache(Fetcher fetcher,
                            std::chrono::milliseconds max_age = std::chrono::seconds(60));
    ~BlockhashCache();

    BlockhashCache(const BlockhashCache&) = delete;
    BlockhashCache& operator=(const BlockhashCache&) = delete;

    // Cached value, or one synchronous fetch when empty or older than max_age.
    // Fetch errors propagate.
    std::string get();

    // Unconditional fetch and store. Fetch errors propagate.
    void refresh();

    std::optional<std::string> peek() const;
    uint64_t fetch_count() const { return fetch_count_.load(); }

    void start(std::chrono::milliseconds interval);
    void stop();
    bool running() const { return running_.load(); }

private:
    Fetcher fetcher_;
    std::chrono::milliseconds max_age_;

    mutable std::mutex mutex_;
    std::optional<std::string> value_;
    std::chrono::steady_clock::time_point fetched_at_;
    std::atomic<uint64_t> fetch_count_{0};

    std::atomic<bool> running_{false};
    StopSignal stop_;
    std::thread refresher_;

    void refresh_loop(std::chrono::milliseconds interval);
};
