#include "keypair.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key_from_seed(const std::array<uint8_t, 32>& seed) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!pkey) {
        throw std::runtime_error("Failed to load ed25519 private key");
    }
    return pkey;
}

Pubkey public_key_of(EVP_PKEY* pkey) {
    Pubkey key;
    size_t len = key.bytes.size();
    if (EVP_PKEY_get_raw_public_key(pkey, key.bytes.data(), &len) != 1 || len != 32) {
        throw std::runtime_error("Failed to read ed25519 public key");
    }
    return key;
}

}

Keypair Keypair::generate() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to initialize ed25519 keygen");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw std::runtime_error("ed25519 keygen failed");
    }
    PkeyPtr pkey(raw);

    Keypair kp;
    size_t len = kp.seed_.size();
    if (EVP_PKEY_get_raw_private_key(pkey.get(), kp.seed_.data(), &len) != 1 || len != 32) {
        throw std::runtime_error("Failed to read ed25519 private key");
    }
    kp.pubkey_ = public_key_of(pkey.get());
    return kp;
}

Keypair Keypair::from_seed(const std::vector<uint8_t>& seed) {
    if (seed.size() != 32) {
        throw std::invalid_argument("ed25519 seed must be 32 bytes");
    }
    Keypair kp;
    std::copy(seed.begin(), seed.end(), kp.seed_.begin());
    kp.pubkey_ = public_key_of(private_key_from_seed(kp.seed_).get());
    return kp;
}

Keypair Keypair::from_secret(const std::vector<uint8_t>& secret) {
    if (secret.size() != 64) {
        throw std::invalid_argument("keypair secret must be 64 bytes, got " + std::to_string(secret.size()));
    }
    Keypair kp = from_seed(std::vector<uint8_t>(secret.begin(), secret.begin() + 32));
    if (!std::equal(kp.pubkey_.bytes.begin(), kp.pubkey_.bytes.end(), secret.begin() + 32)) {
        throw std::invalid_argument("keypair secret public half does not match its seed");
    }
    return kp;
}

Keypair Keypair::from_base58(const std::string& secret) {
    return from_secret(util::base58_decode(secret));
}

Keypair Keypair::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open keypair file: " + path);
    }
    auto j = nlohmann::json::parse(in);
    return from_secret(j.get<std::vector<uint8_t>>());
}

std::vector<uint8_t> Keypair::secret() const {
    std::vector<uint8_t> out(seed_.begin(), seed_.end());
    out.insert(out.end(), pubkey_.bytes.begin(), pubkey_.bytes.end());
    return out;
}

std::string Keypair::secret_base58() const {
    return util::base58_encode(secret());
}

Signature Keypair::sign(const std::vector<uint8_t>& message) const {
    auto pkey = private_key_from_seed(seed_);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        throw std::runtime_error("Failed to initialize ed25519 signing");
    }
    Signature sig{};
    size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message.data(), message.size()) != 1 ||
        sig_len != sig.size()) {
        throw std::runtime_error("ed25519 signing failed");
    }
    return sig;
}

bool Keypair::verify(const Pubkey& key, const std::vector<uint8_t>& message, const Signature& sig) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.bytes.data(), key.bytes.size()));
    if (!pkey) return false;
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), message.data(), message.size()) == 1;
}
