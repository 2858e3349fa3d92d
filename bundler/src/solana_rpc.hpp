#pragma once

#include "http_client.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct BlockhashInfo {
    std::string blockhash;
    uint64_t last_valid_block_height = 0;
};

struct SignatureStatus {
    std::string confirmation_status;   // processed | confirmed | finalized
    std::optional<std::string> err;
};

// JSON-RPC 2.0 client for one endpoint. Every call throws TransportError when
// the POST did not complete and RpcError on a non-2xx status, an unparseable
// body or an error object in the response.
class SolanaRpc {
public:
    SolanaRpc(std::string url, std::shared_ptr<HttpClient> http, int timeout_ms = 10000);

    const std::string& url() const { return url_; }

    // Full JSON-RPC envelope in and out.
    nlohmann::json post(const nlohmann::json& payload, int timeout_ms = 0);
    // Returns the "result" member.
    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::array(),
                        int timeout_ms = 0);

    void get_health(int timeout_ms = 0);
    BlockhashInfo get_latest_blockhash(const std::string& commitment = "confirmed");
    uint64_t get_balance(const std::string& address);
    std::optional<nlohmann::json> get_account_info(const std::string& address);
    std::vector<std::optional<nlohmann::json>> get_multiple_accounts(const std::vector<std::string>& addresses);
    uint64_t get_token_account_balance(const std::string& token_account);
    std::vector<std::string> get_token_accounts_by_owner(const std::string& owner, const std::string& mint);
    std::string send_transaction(const std::string& base64_tx, bool skip_preflight = false);
    std::optional<SignatureStatus> get_signature_status(const std::string& signature);

private:
    std::string url_;
    std::shared_ptr<HttpClient> http_;
    int timeout_ms_;
};

enum class ConfirmOutcome {
    Confirmed,
    Failed,      // landed with an error
    TimedOut,
    Stopped
};

class StopSignal;

// Polls getSignatureStatuses every poll_interval until the commitment level is
// reached. max_wait of zero means no deadline. RPC errors propagate.
ConfirmOutcome wait_for_confirmation(SolanaRpc& rpc,
                                     const std::string& signature,
                                     const std::string& commitment,
                                     std::chrono::milliseconds poll_interval,
                                     std::chrono::milliseconds max_wait,
                                     StopSignal& stop);
