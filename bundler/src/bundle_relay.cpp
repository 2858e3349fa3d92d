#include "bundle_relay.hpp"
#include "errors.hpp"
#include "instructions.hpp"
#include <spdlog/spdlog.h>

HttpBundleRelay::HttpBundleRelay(std::string relay_url,
                                 std::shared_ptr<HttpClient> http,
                                 std::shared_ptr<ResilientClient> client,
                                 Keypair tip_payer,
                                 std::vector<std::string> tip_accounts,
                                 int timeout_ms)
    : endpoint_(relay_url + "/api/v1/bundles")
    , http_(std::move(http))
    , client_(std::move(client))
    , tip_payer_(std::move(tip_payer))
    , timeout_ms_(timeout_ms)
{
    if (!http_ || !client_) {
        throw ConstructionError("HttpBundleRelay requires an HTTP client and an RPC client");
    }
    if (tip_accounts.empty()) {
        throw ConstructionError("HttpBundleRelay requires at least one tip account");
    }
    for (const auto& account : tip_accounts) {
        tip_accounts_.push_back(Pubkey::from_string(account));
    }
    spdlog::info("Bundle relay endpoint: {}", endpoint_);
}

nlohmann::json HttpBundleRelay::make_payload(const std::vector<std::string>& encoded_transactions) {
    return {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "sendBundle"},
        {"params", nlohmann::json::array({encoded_transactions, {{"encoding", "base64"}}})}
    };
}

RelaySubmission HttpBundleRelay::parse_response(long status, const std::string& body) {
    RelaySubmission sub;
    if (status != 200) {
        sub.error_message = "HTTP " + std::to_string(status) + ": " + body;
        return sub;
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        sub.error_message = std::string("Unparseable relay response: ") + e.what();
        return sub;
    }

    if (data.contains("error")) {
        const auto& err = data["error"];
        sub.error_message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        return sub;
    }

    if (data.contains("result")) {
        const auto& result = data["result"];
        if (result.is_string()) {
            sub.bundle_id = result.get<std::string>();
        } else if (result.is_object() && result.contains("bundleId")) {
            sub.bundle_id = result["bundleId"].get<std::string>();
        }
    }
    if (sub.bundle_id.empty() && data.contains("bundle_id") && data["bundle_id"].is_string()) {
        sub.bundle_id = data["bundle_id"].get<std::string>();
    }

    if (sub.bundle_id.empty()) {
        sub.error_message = "Bundle submitted but no bundle ID in response: " + body;
        return sub;
    }
    sub.success = true;
    return sub;
}

RelaySubmission HttpBundleRelay::submit(const std::vector<Transaction>& transactions, uint64_t tip_lamports) {
    std::vector<std::string> encoded;
    encoded.reserve(transactions.size() + 1);
    for (const auto& tx : transactions) {
        encoded.push_back(tx.to_base64());
    }

    if (tip_lamports > 0) {
        const Pubkey& tip_account = tip_accounts_[next_tip_account_++ % tip_accounts_.size()];
        try {
            auto tip_tx = client_->build_transaction(
                {instructions::system_transfer(tip_payer_.pubkey(), tip_account, tip_lamports)}, tip_payer_);
            encoded.push_back(tip_tx.to_base64());
        } catch (const std::exception& e) {
            RelaySubmission sub;
            sub.error_message = std::string("Failed to build tip transaction: ") + e.what();
            return sub;
        }
    }

    HttpResponse resp;
    try {
        resp = http_->post(endpoint_, make_payload(encoded).dump(), timeout_ms_);
    } catch (const std::exception& e) {
        RelaySubmission sub;
        sub.error_message = std::string("Network error submitting bundle: ") + e.what();
        return sub;
    }

    auto sub = parse_response(resp.status, resp.body);
    if (sub.success) {
        spdlog::info("Bundle submitted: {} ({} transactions, tip {} lamports)",
                     sub.bundle_id, encoded.size(), tip_lamports);
    } else {
        spdlog::warn("Bundle rejected: {}", sub.error_message);
    }
    return sub;
}
