#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

class Keypair;

struct Pubkey {
    std::array<uint8_t, 32> bytes{};

    // Throws std::invalid_argument unless the string decodes to exactly 32 bytes.
    static Pubkey from_string(const std::string& base58);
    static Pubkey from_bytes(const std::vector<uint8_t>& raw);

    std::string to_string() const;

    bool operator==(const Pubkey& other) const { return bytes == other.bytes; }
    bool operator!=(const Pubkey& other) const { return bytes != other.bytes; }
    bool operator<(const Pubkey& other) const { return bytes < other.bytes; }
};

using Signature = std::array<uint8_t, 64>;

struct AccountMeta {
    Pubkey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const Pubkey& key, bool signer) { return {key, signer, true}; }
    static AccountMeta readonly(const Pubkey& key, bool signer) { return {key, signer, false}; }
};

struct Instruction {
    Pubkey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed_accounts = 0;
    uint8_t num_readonly_unsigned_accounts = 0;
};

struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> account_indices;
    std::vector<uint8_t> data;
};

// Legacy (non-versioned) message.
struct Message {
    MessageHeader header;
    std::vector<Pubkey> account_keys;
    Pubkey recent_blockhash;
    std::vector<CompiledInstruction> instructions;

    // Fee payer first, then writable signers, readonly signers, writable
    // non-signers, readonly non-signers. Signer/writable flags are merged
    // across duplicate keys. Throws std::invalid_argument past 256 keys.
    static Message compile(const std::vector<Instruction>& instructions,
                           const Pubkey& fee_payer,
                           const Pubkey& recent_blockhash);

    std::vector<uint8_t> serialize() const;
};

struct Transaction {
    std::vector<Signature> signatures;
    Message message;

    static Transaction create(const std::vector<Instruction>& instructions,
                              const Pubkey& fee_payer,
                              const std::string& recent_blockhash);

    // Throws std::invalid_argument when the keypair is not a required signer.
    void sign(const Keypair& signer);
    bool is_fully_signed() const;

    // First signature in base58, the transaction id on chain.
    std::string signature() const;

    std::vector<uint8_t> serialize() const;
    std::string to_base64() const;
};

// Compact-u16 length prefix used throughout the wire format.
void write_shortvec(std::vector<uint8_t>& out, size_t len);
