#include "solana_rpc.hpp"
#include "errors.hpp"
#include "stop_signal.hpp"
#include <spdlog/spdlog.h>

SolanaRpc::SolanaRpc(std::string url, std::shared_ptr<HttpClient> http, int timeout_ms)
    : url_(std::move(url))
    , http_(std::move(http))
    , timeout_ms_(timeout_ms)
{
    if (!http_) {
        throw ConstructionError("SolanaRpc requires an HTTP client");
    }
}

nlohmann::json SolanaRpc::post(const nlohmann::json& payload, int timeout_ms) {
    auto resp = http_->post(url_, payload.dump(), timeout_ms > 0 ? timeout_ms : timeout_ms_);

    if (resp.status < 200 || resp.status >= 300) {
        throw RpcError("HTTP " + std::to_string(resp.status), resp.status);
    }

    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw RpcError(std::string("Failed to parse RPC response: ") + e.what(), resp.status);
    }
}

nlohmann::json SolanaRpc::call(const std::string& method, const nlohmann::json& params, int timeout_ms) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method}
    };
    if (!params.empty()) {
        payload["params"] = params;
    }

    auto response = post(payload, timeout_ms);

    if (response.contains("error")) {
        const auto& err = response["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw RpcError(method + ": " + message);
    }
    if (!response.contains("result")) {
        throw RpcError(method + ": response has no result");
    }
    spdlog::debug("{} via {} ok", method, url_);
    return response["result"];
}

void SolanaRpc::get_health(int timeout_ms) {
    auto result = call("getHealth", nlohmann::json::array(), timeout_ms);
    if (!result.is_string() || result.get<std::string>() != "ok") {
        throw RpcError("getHealth: " + result.dump());
    }
}

BlockhashInfo SolanaRpc::get_latest_blockhash(const std::string& commitment) {
    nlohmann::json config = {{"commitment", commitment}};
    auto result = call("getLatestBlockhash", nlohmann::json::array({config}));
    const auto& value = result.at("value");
    BlockhashInfo info;
    info.blockhash = value.at("blockhash").get<std::string>();
    info.last_valid_block_height = value.value("lastValidBlockHeight", uint64_t{0});
    return info;
}

uint64_t SolanaRpc::get_balance(const std::string& address) {
    auto result = call("getBalance", {address});
    return result.at("value").get<uint64_t>();
}

std::optional<nlohmann::json> SolanaRpc::get_account_info(const std::string& address) {
    auto result = call("getAccountInfo", {address, {{"encoding", "base64"}}});
    const auto& value = result.at("value");
    if (value.is_null()) return std::nullopt;
    return value;
}

std::vector<std::optional<nlohmann::json>>
SolanaRpc::get_multiple_accounts(const std::vector<std::string>& addresses) {
    std::vector<std::optional<nlohmann::json>> accounts;
    if (addresses.empty()) return accounts;

    auto result = call("getMultipleAccounts", {addresses, {{"encoding", "base64"}}});
    for (const auto& value : result.at("value")) {
        if (value.is_null()) {
            accounts.emplace_back(std::nullopt);
        } else {
            accounts.emplace_back(value);
        }
    }
    return accounts;
}

uint64_t SolanaRpc::get_token_account_balance(const std::string& token_account) {
    auto result = call("getTokenAccountBalance", {token_account});
    return std::stoull(result.at("value").at("amount").get<std::string>());
}

std::vector<std::string> SolanaRpc::get_token_accounts_by_owner(const std::string& owner,
                                                                const std::string& mint) {
    auto result = call("getTokenAccountsByOwner", {
        owner,
        {{"mint", mint}},
        {{"encoding", "jsonParsed"}}
    });

    std::vector<std::string> accounts;
    for (const auto& entry : result.at("value")) {
        accounts.push_back(entry.at("pubkey").get<std::string>());
    }
    return accounts;
}

std::string SolanaRpc::send_transaction(const std::string& base64_tx, bool skip_preflight) {
    auto result = call("sendTransaction", {
        base64_tx,
        {{"encoding", "base64"}, {"skipPreflight", skip_preflight}, {"preflightCommitment", "confirmed"}}
    });
    return result.get<std::string>();
}

std::optional<SignatureStatus> SolanaRpc::get_signature_status(const std::string& signature) {
    auto result = call("getSignatureStatuses", {
        nlohmann::json::array({signature}),
        {{"searchTransactionHistory", true}}
    });
    const auto& values = result.at("value");
    if (values.empty() || values[0].is_null()) {
        return std::nullopt;
    }

    const auto& v = values[0];
    SignatureStatus status;
    if (v.contains("confirmationStatus") && v["confirmationStatus"].is_string()) {
        status.confirmation_status = v["confirmationStatus"].get<std::string>();
    }
    if (v.contains("err") && !v["err"].is_null()) {
        status.err = v["err"].dump();
    }
    return status;
}

namespace {
bool commitment_reached(const std::string& level, const std::string& wanted) {
    if (wanted == "processed") return !level.empty();
    if (wanted == "finalized") return level == "finalized";
    return level == "confirmed" || level == "finalized";
}
}

ConfirmOutcome wait_for_confirmation(SolanaRpc& rpc,
                                     const std::string& signature,
                                     const std::string& commitment,
                                     std::chrono::milliseconds poll_interval,
                                     std::chrono::milliseconds max_wait,
                                     StopSignal& stop) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;

    while (true) {
        auto status = rpc.get_signature_status(signature);
        if (status) {
            if (status->err) {
                spdlog::warn("Transaction {} failed on chain: {}", signature, *status->err);
                return ConfirmOutcome::Failed;
            }
            if (commitment_reached(status->confirmation_status, commitment)) {
                return ConfirmOutcome::Confirmed;
            }
        }

        if (max_wait.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            return ConfirmOutcome::TimedOut;
        }
        if (stop.wait_for(poll_interval)) {
            return ConfirmOutcome::Stopped;
        }
    }
}
