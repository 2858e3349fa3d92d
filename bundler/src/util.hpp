#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);

    std::string base58_encode(const std::vector<uint8_t>& data);
    // Throws std::invalid_argument on characters outside the bitcoin alphabet.
    std::vector<uint8_t> base58_decode(const std::string& str);

    std::string base64_encode(const std::vector<uint8_t>& data);
    std::vector<uint8_t> base64_decode(const std::string& str);

    bool is_valid_solana_address(const std::string& address);
    std::string redact_dsn(const std::string& dsn);
    std::string host_of(const std::string& url);

    constexpr uint64_t LAMPORTS_PER_SOL = 1000000000ULL;
    uint64_t sol_to_lamports(double sol);
    double lamports_to_sol(uint64_t lamports);
}
