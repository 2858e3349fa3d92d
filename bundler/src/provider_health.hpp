#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

enum class ProviderStatus {
    Healthy,
    Degraded,
    Unhealthy,
    Unknown
};

std::string to_string(ProviderStatus status);

// Point-in-time copy of one provider's metrics.
struct ProviderHealth {
    std::string url;
    ProviderStatus status = ProviderStatus::Unknown;
    double avg_latency_ms = 0.0;
    double success_rate = 1.0;
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    int consecutive_failures = 0;
    std::string last_error;
    int64_t last_check_ms = 0;
    double score = 0.5;

    nlohmann::json to_json() const;
};

class ProviderHealthTracker {
public:
    static constexpr size_t LATENCY_WINDOW = 100;
    static constexpr int DEGRADED_AFTER = 1;
    static constexpr int UNHEALTHY_AFTER = 3;

    explicit ProviderHealthTracker(std::string url);

    void record_success(double latency_ms);
    void record_failure(const std::string& error) noexcept;

    // 0.5 with no observations, otherwise success rate minus latency and
    // failure penalties, clamped to [0, 1].
    double score() const;

    ProviderStatus status() const;
    double success_rate() const;
    double avg_latency_ms() const;
    int consecutive_failures() const;
    const std::string& url() const { return url_; }

    ProviderHealth snapshot() const;

private:
    const std::string url_;
    mutable std::mutex mutex_;
    std::deque<double> latencies_;
    uint64_t total_requests_ = 0;
    uint64_t successful_requests_ = 0;
    int consecutive_failures_ = 0;
    ProviderStatus status_ = ProviderStatus::Unknown;
    std::string last_error_;
    int64_t last_check_ms_ = 0;

    double score_locked() const;
    double success_rate_locked() const;
    double avg_latency_locked() const;
};
