#include "bundle_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

BundleStore::BundleStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("BundleStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection BundleStore::make_connection() {
    return pqxx::connection(dsn_);
}

void BundleStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS bundle_attempts (
                id BIGSERIAL PRIMARY KEY,
                corr_id TEXT NOT NULL,
                side TEXT NOT NULL CHECK (side IN ('buy','sell')),
                target TEXT NOT NULL,
                attempt INT NOT NULL,
                tip_lamports BIGINT NOT NULL,
                tx_count INT NOT NULL,
                state TEXT NOT NULL,
                bundle_id TEXT,
                error TEXT,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS bundle_attempts_corr_idx ON bundle_attempts (corr_id)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS bundle_results (
                id BIGSERIAL PRIMARY KEY,
                corr_id TEXT UNIQUE NOT NULL,
                side TEXT NOT NULL CHECK (side IN ('buy','sell')),
                target TEXT NOT NULL,
                success BOOLEAN NOT NULL,
                bundle_id TEXT,
                error TEXT,
                tip_paid_lamports BIGINT NOT NULL,
                last_tip_lamports BIGINT NOT NULL,
                tx_count INT NOT NULL,
                identities JSONB NOT NULL,
                attempts INT NOT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void BundleStore::save_attempt(const std::string& corr_id, const std::string& side,
                               const std::string& target, const BundleAttempt& attempt) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO bundle_attempts (corr_id, side, target, attempt, tip_lamports, tx_count, state, bundle_id, error) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, NULLIF($8, ''), NULLIF($9, ''))",
            corr_id, side, target, attempt.attempt,
            static_cast<int64_t>(attempt.tip),
            static_cast<int>(attempt.transaction_count),
            to_string(attempt.state), attempt.bundle_id, attempt.error
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save bundle attempt: {}", e.what());
    }
}

int64_t BundleStore::save_result(const std::string& corr_id, const std::string& side,
                                 const std::string& target, const BundleResult& result) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto rows = txn.exec_params(
            "INSERT INTO bundle_results (corr_id, side, target, success, bundle_id, error, "
            "tip_paid_lamports, last_tip_lamports, tx_count, identities, attempts) "
            "VALUES ($1, $2, $3, $4, NULLIF($5, ''), NULLIF($6, ''), $7, $8, $9, $10::jsonb, $11) "
            "ON CONFLICT (corr_id) DO UPDATE SET success = EXCLUDED.success, bundle_id = EXCLUDED.bundle_id, "
            "error = EXCLUDED.error, tip_paid_lamports = EXCLUDED.tip_paid_lamports, "
            "last_tip_lamports = EXCLUDED.last_tip_lamports, attempts = EXCLUDED.attempts "
            "RETURNING id",
            corr_id, side, target, result.success, result.bundle_id, result.error_message,
            static_cast<int64_t>(result.tip_paid),
            static_cast<int64_t>(result.last_tip),
            static_cast<int>(result.transactions_submitted),
            nlohmann::json(result.identities).dump(),
            result.attempts
        );

        txn.commit();
        return rows[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save bundle result: {}", e.what());
        throw;
    }
}

std::vector<nlohmann::json> BundleStore::recent_results(int limit) {
    std::vector<nlohmann::json> results;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto rows = txn.exec_params(
            "SELECT corr_id, side, target, success, COALESCE(bundle_id, ''), COALESCE(error, ''), "
            "tip_paid_lamports, attempts, ts::text "
            "FROM bundle_results ORDER BY ts DESC LIMIT $1",
            limit
        );

        for (const auto& row : rows) {
            results.push_back({
                {"corr_id", row[0].as<std::string>()},
                {"side", row[1].as<std::string>()},
                {"target", row[2].as<std::string>()},
                {"success", row[3].as<bool>()},
                {"bundle_id", row[4].as<std::string>()},
                {"error", row[5].as<std::string>()},
                {"tip_paid_lamports", row[6].as<int64_t>()},
                {"attempts", row[7].as<int>()},
                {"ts", row[8].as<std::string>()}
            });
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to read bundle results: {}", e.what());
    }

    return results;
}

bool BundleStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::nontransaction txn(conn);
        txn.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
