#pragma once

#include "solana_types.hpp"
#include <array>
#include <string>
#include <vector>

// ed25519 signing identity backed by OpenSSL EVP.
class Keypair {
public:
    static Keypair generate();
    // 32-byte seed.
    static Keypair from_seed(const std::vector<uint8_t>& seed);
    // 64-byte seed || pubkey layout used by solana-keygen files.
    // Throws std::invalid_argument on bad length or a pubkey that does not match the seed.
    static Keypair from_secret(const std::vector<uint8_t>& secret);
    static Keypair from_base58(const std::string& secret);
    // JSON array of 64 integers, as written by solana-keygen.
    static Keypair from_file(const std::string& path);

    const Pubkey& pubkey() const { return pubkey_; }
    std::vector<uint8_t> secret() const;
    std::string secret_base58() const;

    Signature sign(const std::vector<uint8_t>& message) const;
    static bool verify(const Pubkey& key, const std::vector<uint8_t>& message, const Signature& sig);

private:
    std::array<uint8_t, 32> seed_{};
    Pubkey pubkey_;
};
