#include "agentlink/memo.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace agentlink;

static bool rejects(const std::string& memo) {
    try {
        TopicMemo::decode(memo);
    } catch (const MemoError& e) {
        assert(e.code() == ErrorCode::MalformedMemo);
        return true;
    }
    return false;
}

static bool rejects_tx(const std::string& memo) {
    try {
        TransactionMemo::decode(memo);
    } catch (const MemoError&) {
        return true;
    }
    return false;
}

void test_known_topic_memos() {
    std::cout << "Test: topic memo encodings... ";
    assert(TopicMemo::inbound(60, "0.0.5005").encode() == "hcs-10:0:60:0:0.0.5005");
    assert(TopicMemo::outbound(60).encode() == "hcs-10:0:60:1");
    assert(TopicMemo::connection(60, "0.0.100", "12345").encode() == "hcs-10:1:60:2:0.0.100:12345");
    std::cout << "OK" << std::endl;
}

void test_round_trip_all_roles_and_flags() {
    std::cout << "Test: topic memo round trip for every role and auth flag... ";
    for (bool dual : {false, true}) {
        for (TopicRole role : {TopicRole::Inbound, TopicRole::Outbound, TopicRole::Connection}) {
            TopicMemo m;
            m.dual_control = dual;
            m.ttl_seconds = 3600;
            m.role = role;
            if (role == TopicRole::Inbound) m.refs = {"0.0.7"};
            if (role == TopicRole::Connection) m.refs = {"0.0.8", "conn-1"};

            std::string encoded = m.encode();
            TopicMemo decoded = TopicMemo::decode(encoded);
            assert(decoded == m);
            assert(decoded.encode() == encoded);
        }
    }
    std::cout << "OK" << std::endl;
}

void test_decode_fields() {
    std::cout << "Test: connection memo decode... ";
    TopicMemo m = TopicMemo::decode("hcs-10:1:60:2:0.0.10:42");
    assert(m.dual_control);
    assert(m.ttl_seconds == 60);
    assert(m.role == TopicRole::Connection);
    assert(m.refs.size() == 2);
    assert(m.refs[0] == "0.0.10");
    assert(m.refs[1] == "42");
    std::cout << "OK" << std::endl;
}

void test_malformed_topic_memos() {
    std::cout << "Test: malformed topic memos are rejected... ";
    assert(rejects(""));
    assert(rejects("hcs-11:0:60:1"));            // wrong marker
    assert(rejects("hcs-10:0:60"));              // too few fields
    assert(rejects("hcs-10:2:60:1"));            // auth flag out of range
    assert(rejects("hcs-10:x:60:1"));            // non-numeric flag
    assert(rejects("hcs-10:0:sixty:1"));         // non-numeric ttl
    assert(rejects("hcs-10:0:-60:1"));           // signed ttl
    assert(rejects("hcs-10:0:60:3"));            // unknown role
    assert(rejects("hcs-10:0:60:0"));            // inbound without owner
    assert(rejects("hcs-10:0:60:0:"));           // empty owner
    assert(rejects("hcs-10:0:60:1:0.0.1"));      // outbound with a ref
    assert(rejects("hcs-10:1:60:2:0.0.10"));     // connection missing connection id
    assert(rejects("hcs-10:1:60:2:0.0.10:42:x")); // too many refs
    assert(rejects("hcs-10:0:99999999999:1"));   // ttl overflow
    assert(rejects("hcs-10:00:060:01"));         // leading zeros
    assert(rejects("hcs-10:0:060:1"));
    assert(rejects("hcs-10:0:60:01"));
    assert(TopicMemo::decode("hcs-10:0:0:1").ttl_seconds == 0);
    std::cout << "OK" << std::endl;
}

void test_encode_rejects_bad_refs() {
    std::cout << "Test: encode rejects invalid refs... ";
    bool threw = false;
    try {
        TopicMemo::connection(60, "0.0.1", "a:b").encode();
    } catch (const MemoError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TopicMemo::inbound(60, "").encode();
    } catch (const MemoError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "OK" << std::endl;
}

void test_transaction_memos() {
    std::cout << "Test: transaction memos per operation... ";
    assert(TransactionMemo::for_operation(Operation::Register).encode() == "hcs-10:op:0:0");
    assert(TransactionMemo::for_operation(Operation::ConnectionCreated).encode() == "hcs-10:op:4:1");
    assert(TransactionMemo::for_operation(Operation::Message).encode() == "hcs-10:op:6:3");
    assert(TransactionMemo::for_operation(Operation::Transaction).encode() == "hcs-10:op:7:3");

    TransactionMemo m = TransactionMemo::decode("hcs-10:op:7:3");
    assert(m.operation == Operation::Transaction);
    assert(m.version == 3);

    assert(rejects_tx("hcs-10:op:5:0"));      // unknown opcode
    assert(rejects_tx("hcs-10:xx:6:3"));
    assert(rejects_tx("hcs-9:op:6:3"));
    assert(rejects_tx("hcs-10:op:6"));
    assert(rejects_tx("hcs-10:op:6:v3"));
    assert(rejects_tx("hcs-10:op:06:003"));   // leading zeros
    assert(rejects_tx("hcs-10:op:6:03"));
    assert(rejects_tx("hcs-10:op:6:1"));      // version does not match the operation
    assert(rejects_tx("hcs-10:op:0:3"));
    assert(TransactionMemo::decode("hcs-10:op:0:0").operation == Operation::Register);
    std::cout << "OK" << std::endl;
}

void test_operation_names() {
    std::cout << "Test: operation names... ";
    Operation op;
    assert(operation_from_name("connection_created", op) && op == Operation::ConnectionCreated);
    assert(operation_from_name("transaction", op) && op == Operation::Transaction);
    assert(!operation_from_name("close_connection", op));
    assert(std::string(operation_name(Operation::Register)) == "register");
    std::cout << "OK" << std::endl;
}

int main() {
    try {
        test_known_topic_memos();
        test_round_trip_all_roles_and_flags();
        test_decode_fields();
        test_malformed_topic_memos();
        test_encode_rejects_bad_refs();
        test_transaction_memos();
        test_operation_names();
        std::cout << "Memo codec tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
