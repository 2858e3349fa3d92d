#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<BundleStore> store,
                         std::shared_ptr<ResilientClient> client,
                         std::shared_ptr<IdentityPool> pool,
                         std::shared_ptr<BundleCoordinator> coordinator)
    : redis_(redis), store_(store), client_(client), pool_(pool), coordinator_(coordinator) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = !store_ || store_->ping();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", store_ ? nlohmann::json(pg_ok) : nlohmann::json("disabled")},
        {"pool_ready", pool_->initialized()},
        {"ts", util::current_iso8601()}
    };

    if (auto router = client_->router()) {
        status["rpc"] = router->health_summary();
    } else {
        status["rpc"] = {
            {"current_provider", client_->endpoint()},
            {"healthy", client_->get_health()}
        };
    }
    return status;
}

nlohmann::json HealthCheck::get_stats() const {
    return {
        {"bundles", coordinator_->get_stats().to_json()},
        {"identities", pool_->get_stats().to_json()},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && (!store_ || store_->ping());
}
