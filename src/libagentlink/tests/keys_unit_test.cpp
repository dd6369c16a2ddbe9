#include "agentlink/keys.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace agentlink;

void test_sign_verify() {
    std::cout << "Test: Ed25519 sign / verify... ";
    KeyPair key = KeyPair::generate();
    assert(key.public_key().size() == 32);
    assert(key.public_key_hex().size() == 64);

    std::vector<uint8_t> msg = {'h', 'c', 's', '-', '1', '0'};
    auto sig = key.sign(msg);
    assert(sig.size() == 64);
    assert(KeyPair::verify(key.public_key(), msg, sig));

    msg[0] = 'H';
    assert(!KeyPair::verify(key.public_key(), msg, sig));

    KeyPair other = KeyPair::generate();
    assert(other.public_key() != key.public_key());
    std::cout << "OK" << std::endl;
}

void test_from_hex_seed_is_deterministic() {
    std::cout << "Test: key pair from hex seed... ";
    std::string seed(64, '7');
    KeyPair a = KeyPair::from_hex(seed);
    KeyPair b = KeyPair::from_hex(seed);
    assert(a.public_key() == b.public_key());

    bool threw = false;
    try {
        KeyPair::from_hex("abcd");
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
    std::cout << "OK" << std::endl;
}

void test_hex_helpers() {
    std::cout << "Test: hex helpers... ";
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xa5, 0xff};
    assert(to_hex(bytes) == "000fa5ff");
    assert(from_hex("000fa5ff") == bytes);
    assert(from_hex("000FA5FF") == bytes);
    std::cout << "OK" << std::endl;
}

void test_key_policy() {
    std::cout << "Test: threshold key policy... ";
    KeyPair local = KeyPair::generate();
    KeyPair remote = KeyPair::generate();

    KeyPolicy single = KeyPolicy::single(local);
    assert(!single.is_threshold());
    assert(single.satisfiable());

    KeyPolicy half = KeyPolicy::threshold_of(2, {local.public_key_hex()});
    assert(half.is_threshold());
    assert(!half.satisfiable());
    assert(half.describe() == "2-of-1");

    KeyPolicy both = KeyPolicy::threshold_of(2, {local.public_key_hex(), remote.public_key_hex()});
    assert(both.satisfiable());
    assert(both.describe() == "2-of-2");

    Json::Value json = both.to_json();
    assert(json["threshold"].asUInt() == 2);
    assert(json["keys"].size() == 2);
    assert(json["keys"][1].asString() == remote.public_key_hex());
    std::cout << "OK" << std::endl;
}

int main() {
    try {
        test_sign_verify();
        test_from_hex_seed_is_deterministic();
        test_hex_helpers();
        test_key_policy();
        std::cout << "Key tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
