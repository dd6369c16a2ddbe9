#include "agentlink/keys.hpp"
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace agentlink {

namespace {
    void ensure_sodium() {
        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium init failed");
        }
    }
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(&out[0], out.size(), bytes.data(), bytes.size());
    out.resize(bytes.size() * 2);
    return out;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    ensure_sodium();
    std::vector<uint8_t> out(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(),
                       nullptr, &bin_len, &end) != 0 ||
        end != hex.c_str() + hex.size()) {
        throw std::runtime_error("invalid hex string");
    }
    out.resize(bin_len);
    return out;
}

KeyPair::~KeyPair() {
    if (!secret_key_.empty())
        sodium_memzero(secret_key_.data(), secret_key_.size());
}

KeyPair KeyPair::generate() {
    ensure_sodium();
    KeyPair kp;
    kp.public_key_.resize(crypto_sign_PUBLICKEYBYTES);
    kp.secret_key_.resize(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(kp.public_key_.data(), kp.secret_key_.data()) != 0)
        throw std::runtime_error("KeyPair: failed to generate key pair");
    return kp;
}

KeyPair KeyPair::from_hex(const std::string& hex) {
    ensure_sodium();
    std::vector<uint8_t> raw = agentlink::from_hex(hex);

    KeyPair kp;
    kp.public_key_.resize(crypto_sign_PUBLICKEYBYTES);
    kp.secret_key_.resize(crypto_sign_SECRETKEYBYTES);

    if (raw.size() == crypto_sign_SEEDBYTES) {
        if (crypto_sign_seed_keypair(kp.public_key_.data(), kp.secret_key_.data(), raw.data()) != 0)
            throw std::runtime_error("KeyPair: failed to derive key pair from seed");
    } else if (raw.size() == crypto_sign_SECRETKEYBYTES) {
        kp.secret_key_ = raw;
        if (crypto_sign_ed25519_sk_to_pk(kp.public_key_.data(), kp.secret_key_.data()) != 0)
            throw std::runtime_error("KeyPair: failed to extract public key");
    } else {
        sodium_memzero(raw.data(), raw.size());
        throw std::runtime_error("KeyPair: key must be 32 or 64 bytes");
    }
    sodium_memzero(raw.data(), raw.size());
    return kp;
}

std::vector<uint8_t> KeyPair::sign(const std::vector<uint8_t>& message) const {
    std::vector<uint8_t> sig(crypto_sign_BYTES);
    unsigned long long sig_len = 0;
    if (crypto_sign_detached(sig.data(), &sig_len, message.data(), message.size(),
                             secret_key_.data()) != 0) {
        throw std::runtime_error("KeyPair: signing failed");
    }
    sig.resize(static_cast<size_t>(sig_len));
    return sig;
}

bool KeyPair::verify(const std::vector<uint8_t>& public_key,
                     const std::vector<uint8_t>& message,
                     const std::vector<uint8_t>& signature) {
    ensure_sodium();
    if (public_key.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES)
        return false;
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == 0;
}

std::string KeyPair::public_key_hex() const {
    return to_hex(public_key_);
}

KeyPolicy KeyPolicy::single(const KeyPair& key) {
    KeyPolicy p;
    p.threshold = 1;
    p.public_keys = {key.public_key_hex()};
    return p;
}

KeyPolicy KeyPolicy::threshold_of(uint32_t threshold, const std::vector<std::string>& public_keys) {
    KeyPolicy p;
    p.threshold = threshold;
    p.public_keys = public_keys;
    return p;
}

Json::Value KeyPolicy::to_json() const {
    Json::Value out(Json::objectValue);
    out["threshold"] = threshold;
    Json::Value keys(Json::arrayValue);
    for (const auto& k : public_keys) keys.append(k);
    out["keys"] = keys;
    return out;
}

std::string KeyPolicy::describe() const {
    std::ostringstream out;
    out << threshold << "-of-" << public_keys.size();
    return out.str();
}

} // namespace agentlink
