#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;
    std::string stream_audit;
    std::string consumer_group;
    std::string consumer_name;

    // Postgres (empty disables bundle history)
    std::string pg_dsn;

    // Solana RPC
    std::vector<std::string> rpc_urls;
    int rpc_timeout_ms;
    int health_check_interval_ms;
    int blockhash_refresh_ms;
    double min_success_rate;
    double max_latency_ms;
    int send_max_retries;
    int http_max_connections;
    int http_max_per_host;

    // Identities
    std::string funding_keypair;
    std::string funding_keypair_path;
    int num_identities;
    double min_balance_sol;
    double target_balance_sol;
    std::string identity_store_path;

    // Bundles
    std::string relay_url;
    std::vector<std::string> tip_accounts;
    std::string instruction_service_url;
    uint64_t initial_tip_lamports;
    uint64_t tip_increment_lamports;
    uint64_t max_tip_lamports;
    int bundle_max_retries;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static uint64_t get_env_u64(const char* name, uint64_t default_val);
    static double get_env_double(const char* name, double default_val);
};
