#pragma once

#include "http_client.hpp"
#include "keypair.hpp"
#include "resilient_client.hpp"
#include "solana_types.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RelaySubmission {
    bool success = false;
    std::string bundle_id;
    std::string error_message;
};

// All-or-nothing submission of a set of signed transactions.
class BundleRelay {
public:
    virtual ~BundleRelay() = default;
    virtual RelaySubmission submit(const std::vector<Transaction>& transactions, uint64_t tip_lamports) = 0;
};

constexpr const char* DEFAULT_TIP_ACCOUNT = "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU4";

// sendBundle over HTTP. Appends one tip transfer, signed by tip_payer, to a
// rotating tip account.
class HttpBundleRelay : public BundleRelay {
public:
    HttpBundleRelay(std::string relay_url,
                    std::shared_ptr<HttpClient> http,
                    std::shared_ptr<ResilientClient> client,
                    Keypair tip_payer,
                    std::vector<std::string> tip_accounts = {DEFAULT_TIP_ACCOUNT},
                    int timeout_ms = 10000);

    RelaySubmission submit(const std::vector<Transaction>& transactions, uint64_t tip_lamports) override;

    static nlohmann::json make_payload(const std::vector<std::string>& encoded_transactions);
    static RelaySubmission parse_response(long status, const std::string& body);

private:
    std::string endpoint_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<ResilientClient> client_;
    Keypair tip_payer_;
    std::vector<Pubkey> tip_accounts_;
    std::atomic<size_t> next_tip_account_{0};
    int timeout_ms_;
};
