#include "solana_types.hpp"
#include "keypair.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

Pubkey Pubkey::from_string(const std::string& base58) {
    return from_bytes(util::base58_decode(base58));
}

Pubkey Pubkey::from_bytes(const std::vector<uint8_t>& raw) {
    if (raw.size() != 32) {
        throw std::invalid_argument("public key must be 32 bytes, got " + std::to_string(raw.size()));
    }
    Pubkey key;
    std::copy(raw.begin(), raw.end(), key.bytes.begin());
    return key;
}

std::string Pubkey::to_string() const {
    return util::base58_encode(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

void write_shortvec(std::vector<uint8_t>& out, size_t len) {
    if (len > 0xffff) {
        throw std::invalid_argument("shortvec length out of range");
    }
    size_t rem = len;
    while (true) {
        uint8_t elem = rem & 0x7f;
        rem >>= 7;
        if (rem == 0) {
            out.push_back(elem);
            break;
        }
        out.push_back(elem | 0x80);
    }
}

Message Message::compile(const std::vector<Instruction>& instructions,
                         const Pubkey& fee_payer,
                         const Pubkey& recent_blockhash) {
    std::vector<AccountMeta> all_accounts;
    all_accounts.push_back(AccountMeta::writable(fee_payer, true));

    auto merge = [&all_accounts](const AccountMeta& meta) {
        for (auto& existing : all_accounts) {
            if (existing.pubkey == meta.pubkey) {
                existing.is_signer = existing.is_signer || meta.is_signer;
                existing.is_writable = existing.is_writable || meta.is_writable;
                return;
            }
        }
        all_accounts.push_back(meta);
    };

    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            merge(meta);
        }
        merge(AccountMeta::readonly(ix.program_id, false));
    }

    // stable_partition keeps first-seen order inside each class
    auto signers_end = std::stable_partition(all_accounts.begin(), all_accounts.end(),
        [](const AccountMeta& m) { return m.is_signer; });
    std::stable_partition(all_accounts.begin(), signers_end,
        [](const AccountMeta& m) { return m.is_writable; });
    std::stable_partition(signers_end, all_accounts.end(),
        [](const AccountMeta& m) { return m.is_writable; });

    if (all_accounts.size() > 256) {
        throw std::invalid_argument("too many accounts in message");
    }

    Message msg;
    msg.recent_blockhash = recent_blockhash;
    size_t readonly_signed = 0;
    size_t readonly_unsigned = 0;
    size_t signers = 0;
    for (const auto& meta : all_accounts) {
        msg.account_keys.push_back(meta.pubkey);
        if (meta.is_signer) {
            signers++;
            if (!meta.is_writable) readonly_signed++;
        } else if (!meta.is_writable) {
            readonly_unsigned++;
        }
    }
    msg.header.num_required_signatures = static_cast<uint8_t>(signers);
    msg.header.num_readonly_signed_accounts = static_cast<uint8_t>(readonly_signed);
    msg.header.num_readonly_unsigned_accounts = static_cast<uint8_t>(readonly_unsigned);

    std::map<Pubkey, uint8_t> index_of;
    for (size_t i = 0; i < msg.account_keys.size(); ++i) {
        index_of[msg.account_keys[i]] = static_cast<uint8_t>(i);
    }

    for (const auto& ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = index_of.at(ix.program_id);
        for (const auto& meta : ix.accounts) {
            compiled.account_indices.push_back(index_of.at(meta.pubkey));
        }
        compiled.data = ix.data;
        msg.instructions.push_back(std::move(compiled));
    }

    return msg;
}

std::vector<uint8_t> Message::serialize() const {
    std::vector<uint8_t> out;
    out.push_back(header.num_required_signatures);
    out.push_back(header.num_readonly_signed_accounts);
    out.push_back(header.num_readonly_unsigned_accounts);

    write_shortvec(out, account_keys.size());
    for (const auto& key : account_keys) {
        out.insert(out.end(), key.bytes.begin(), key.bytes.end());
    }
    out.insert(out.end(), recent_blockhash.bytes.begin(), recent_blockhash.bytes.end());

    write_shortvec(out, instructions.size());
    for (const auto& ix : instructions) {
        out.push_back(ix.program_id_index);
        write_shortvec(out, ix.account_indices.size());
        out.insert(out.end(), ix.account_indices.begin(), ix.account_indices.end());
        write_shortvec(out, ix.data.size());
        out.insert(out.end(), ix.data.begin(), ix.data.end());
    }
    return out;
}

Transaction Transaction::create(const std::vector<Instruction>& instructions,
                                const Pubkey& fee_payer,
                                const std::string& recent_blockhash) {
    Transaction tx;
    tx.message = Message::compile(instructions, fee_payer, Pubkey::from_string(recent_blockhash));
    tx.signatures.resize(tx.message.header.num_required_signatures);
    for (auto& sig : tx.signatures) {
        sig.fill(0);
    }
    return tx;
}

void Transaction::sign(const Keypair& signer) {
    const Pubkey key = signer.pubkey();
    for (size_t i = 0; i < message.header.num_required_signatures; ++i) {
        if (message.account_keys[i] == key) {
            signatures[i] = signer.sign(message.serialize());
            return;
        }
    }
    throw std::invalid_argument("keypair " + key.to_string() + " is not a signer of this transaction");
}

bool Transaction::is_fully_signed() const {
    return std::none_of(signatures.begin(), signatures.end(), [](const Signature& s) {
        return std::all_of(s.begin(), s.end(), [](uint8_t b) { return b == 0; });
    });
}

std::string Transaction::signature() const {
    if (signatures.empty()) return "";
    return util::base58_encode(std::vector<uint8_t>(signatures[0].begin(), signatures[0].end()));
}

std::vector<uint8_t> Transaction::serialize() const {
    std::vector<uint8_t> out;
    write_shortvec(out, signatures.size());
    for (const auto& sig : signatures) {
        out.insert(out.end(), sig.begin(), sig.end());
    }
    auto msg = message.serialize();
    out.insert(out.end(), msg.begin(), msg.end());
    return out;
}

std::string Transaction::to_base64() const {
    return util::base64_encode(serialize());
}
