#pragma once

#include <json/json.h>
#include <cstdint>
#include <string>
#include <vector>

namespace agentlink {

// Ed25519 signing key pair. The secret half is wiped on destruction.
class KeyPair {
public:
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
    ~KeyPair();

    static KeyPair generate();

    // Accepts a 32-byte seed or a 64-byte secret key, hex encoded.
    static KeyPair from_hex(const std::string& hex);

    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;
    static bool verify(const std::vector<uint8_t>& public_key,
                       const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature);

    const std::vector<uint8_t>& public_key() const { return public_key_; }
    std::string public_key_hex() const;

private:
    KeyPair() = default;

    std::vector<uint8_t> public_key_;   // 32 bytes
    std::vector<uint8_t> secret_key_;   // 64 bytes (seed || public key)
};

// Authorization requirement attached to a topic as admin or submit key.
// A threshold policy needs `threshold` signatures out of `public_keys`.
struct KeyPolicy {
    uint32_t threshold = 1;
    std::vector<std::string> public_keys;   // hex encoded

    static KeyPolicy single(const KeyPair& key);
    static KeyPolicy threshold_of(uint32_t threshold, const std::vector<std::string>& public_keys);

    bool is_threshold() const { return threshold > 1 || public_keys.size() > 1; }

    // False while fewer keys are enumerated than the threshold requires.
    bool satisfiable() const { return public_keys.size() >= threshold; }

    Json::Value to_json() const;
    std::string describe() const;
};

std::string to_hex(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> from_hex(const std::string& hex);

} // namespace agentlink
