#pragma once

#include "bundle_coordinator.hpp"
#include "bundle_store.hpp"
#include "identity_pool.hpp"
#include "redis_bus.hpp"
#include "resilient_client.hpp"
#include <memory>
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    // store may be null when persistence is disabled.
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<BundleStore> store,
                std::shared_ptr<ResilientClient> client,
                std::shared_ptr<IdentityPool> pool,
                std::shared_ptr<BundleCoordinator> coordinator);

    nlohmann::json get_status() const;
    nlohmann::json get_stats() const;
    bool is_healthy() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<BundleStore> store_;
    std::shared_ptr<ResilientClient> client_;
    std::shared_ptr<IdentityPool> pool_;
    std::shared_ptr<BundleCoordinator> coordinator_;
};
