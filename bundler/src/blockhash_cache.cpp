#include "blockhash_cache.hpp"
#include <spdlog/spdlog.h>

BlockhashCache::BlockhashCache(Fetcher fetcher, std::chrono::milliseconds max_age)
    : fetcher_(std::move(fetcher))
    , max_age_(max_age)
{
}

BlockhashCache::~BlockhashCache() {
    stop();
}

std::string BlockhashCache::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    if (value_ && now - fetched_at_ < max_age_) {
        return *value_;
    }

    fetch_count_++;
    value_ = fetcher_();
    fetched_at_ = std::chrono::steady_clock::now();
    spdlog::debug("Fetched blockhash {}", *value_);
    return *value_;
}

void BlockhashCache::refresh() {
    fetch_count_++;
    std::string fresh = fetcher_();

    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(fresh);
    fetched_at_ = std::chrono::steady_clock::now();
}

std::optional<std::string> BlockhashCache::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

void BlockhashCache::start(std::chrono::milliseconds interval) {
    if (running_.exchange(true)) {
        return;
    }
    stop_.reset();
    refresher_ = std::thread(&BlockhashCache::refresh_loop, this, interval);
}

void BlockhashCache::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stop_.request_stop();
    if (refresher_.joinable()) {
        refresher_.join();
    }
}

void BlockhashCache::refresh_loop(std::chrono::milliseconds interval) {
    spdlog::debug("Blockhash refresh loop started ({}ms)", interval.count());

    while (!stop_.wait_for(interval)) {
        try {
            refresh();
        } catch (const std::exception& e) {
            spdlog::warn("Blockhash refresh failed: {}", e.what());
        }
    }

    spdlog::debug("Blockhash refresh loop stopped");
}
