#pragma once

#include "bundle_coordinator.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>

// Bundle history in PostgreSQL. Each bundle gets a correlation id that ties
// its attempts to its final result.
class BundleStore {
public:
    explicit BundleStore(const std::string& dsn);

    void init_schema();

    void save_attempt(const std::string& corr_id, const std::string& side,
                      const std::string& target, const BundleAttempt& attempt);
    int64_t save_result(const std::string& corr_id, const std::string& side,
                        const std::string& target, const BundleResult& result);

    std::vector<nlohmann::json> recent_results(int limit = 20);

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();
};
