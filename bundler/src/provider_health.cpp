#include "provider_health.hpp"
#include "util.hpp"
#include <algorithm>
#include <numeric>

std::string to_string(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::Healthy: return "healthy";
        case ProviderStatus::Degraded: return "degraded";
        case ProviderStatus::Unhealthy: return "unhealthy";
        case ProviderStatus::Unknown: return "unknown";
    }
    return "unknown";
}

nlohmann::json ProviderHealth::to_json() const {
    return {
        {"url", url},
        {"status", to_string(status)},
        {"avg_latency_ms", avg_latency_ms},
        {"success_rate", success_rate},
        {"total_requests", total_requests},
        {"consecutive_failures", consecutive_failures},
        {"score", score},
        {"last_error", last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(last_error)},
        {"last_check_ms", last_check_ms}
    };
}

ProviderHealthTracker::ProviderHealthTracker(std::string url) : url_(std::move(url)) {}

void ProviderHealthTracker::record_success(double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_requests_++;
    successful_requests_++;
    consecutive_failures_ = 0;

    latencies_.push_back(latency_ms);
    while (latencies_.size() > LATENCY_WINDOW) {
        latencies_.pop_front();
    }

    status_ = ProviderStatus::Healthy;
    last_error_.clear();
    last_check_ms_ = util::current_timestamp_ms();
}

void ProviderHealthTracker::record_failure(const std::string& error) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    total_requests_++;
    consecutive_failures_++;

    if (consecutive_failures_ >= UNHEALTHY_AFTER) {
        status_ = ProviderStatus::Unhealthy;
    } else if (consecutive_failures_ >= DEGRADED_AFTER) {
        status_ = ProviderStatus::Degraded;
    } else {
        status_ = ProviderStatus::Healthy;
    }

    last_error_ = error;
    last_check_ms_ = util::current_timestamp_ms();
}

double ProviderHealthTracker::success_rate_locked() const {
    if (total_requests_ == 0) return 1.0;
    return static_cast<double>(successful_requests_) / static_cast<double>(total_requests_);
}

double ProviderHealthTracker::avg_latency_locked() const {
    if (latencies_.empty()) return 0.0;
    return std::accumulate(latencies_.begin(), latencies_.end(), 0.0) /
           static_cast<double>(latencies_.size());
}

double ProviderHealthTracker::score_locked() const {
    if (total_requests_ == 0) return 0.5;

    double latency_penalty = std::min(avg_latency_locked() / 1000.0, 1.0) * 0.2;
    double failure_penalty = std::min(consecutive_failures_ / 5.0, 1.0) * 0.3;
    double score = success_rate_locked() - latency_penalty - failure_penalty;
    return std::clamp(score, 0.0, 1.0);
}

double ProviderHealthTracker::score() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return score_locked();
}

ProviderStatus ProviderHealthTracker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

double ProviderHealthTracker::success_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return success_rate_locked();
}

double ProviderHealthTracker::avg_latency_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return avg_latency_locked();
}

int ProviderHealthTracker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

ProviderHealth ProviderHealthTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProviderHealth h;
    h.url = url_;
    h.status = status_;
    h.avg_latency_ms = avg_latency_locked();
    h.success_rate = success_rate_locked();
    h.total_requests = total_requests_;
    h.successful_requests = successful_requests_;
    h.consecutive_failures = consecutive_failures_;
    h.last_error = last_error_;
    h.last_check_ms = last_check_ms_;
    h.score = score_locked();
    return h;
}
