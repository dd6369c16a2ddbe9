#include "agentlink/agent.hpp"
#include "agentlink/in_memory_ledger.hpp"
#include "fake_ledger.hpp"
#include <iostream>
#include <cassert>
#include <memory>

using namespace agentlink;
using agentlink::testing::FakeLedger;

static AgentConfig config_for(const std::string& operator_id) {
    AgentConfig config;
    config.operator_id = operator_id;
    config.network = "testnet";
    config.ttl_seconds = 60;
    return config;
}

void test_two_agent_session() {
    std::cout << "Test: agent A opens a connection to B and sends a message... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    Agent a(config_for("0.0.1"), ledger);

    InitResult init = a.initialize();
    assert(init.status.ok());
    assert(init.inbound_topic_id == "0.0.10");
    assert(init.outbound_topic_id == "0.0.11");
    assert(ledger->topics[0].memo == "hcs-10:0:60:0:0.0.1");
    assert(ledger->topics[1].memo == "hcs-10:0:60:1");

    ConnectionResult conn = a.create_connection_topic("0.0.2", "42");
    assert(conn.status.ok());
    assert(conn.connection.connection_topic_id == "0.0.12");
    assert(ledger->topics[2].memo == "hcs-10:1:60:2:0.0.10:42");
    assert(conn.connection.notified);

    SubmitResult sent = a.send_message("0.0.12", "0.0.2", "hello");
    assert(sent.status.ok());
    assert(sent.topic_id == "0.0.12");
    assert(sent.sequence_number == 1);

    const auto& last = ledger->submissions.back();
    assert(last.topic_id == "0.0.12");
    assert(last.transaction_memo == "hcs-10:op:6:3");
    Envelope env = ledger->envelope_at(ledger->submissions.size() - 1);
    assert(env.operation == Operation::Message);
    assert(env.operator_id == "0.0.1@0.0.2");
    assert(env.field("data") == "hello");

    SubmitResult approval = a.request_transaction_approval("0.0.12", "0.0.2", "0.0.9000", "transfer");
    assert(approval.status.ok());
    assert(approval.sequence_number == 2);
    assert(ledger->submissions.back().transaction_memo == "hcs-10:op:7:3");

    auto stored = a.find_connection("42");
    assert(stored && stored->state == ConnectionState::Created);
    assert(a.connections().size() == 1);
    std::cout << "OK" << std::endl;
}

void test_unconfigured_agent() {
    std::cout << "Test: every operation fails without a ledger client... ";
    auto ledger = std::make_shared<FakeLedger>(10, false);
    Agent a(config_for("0.0.1"), ledger);

    assert(a.initialize().status.code == ErrorCode::ClientNotInitialized);
    assert(a.create_connection_topic("0.0.2", "42").status.code == ErrorCode::ClientNotInitialized);
    assert(a.send_message("0.0.12", "0.0.2", "hi").status.code == ErrorCode::ClientNotInitialized);
    assert(a.request_transaction_approval("0.0.12", "0.0.2", "0.0.9", "d").status.code ==
           ErrorCode::ClientNotInitialized);
    assert(a.create_topic("memo").status.code == ErrorCode::ClientNotInitialized);
    assert(a.submit_message("0.0.12", Json::Value("x")).status.code == ErrorCode::ClientNotInitialized);

    assert(ledger->create_calls == 0);
    assert(ledger->submit_calls == 0);
    assert(!a.status().client_initialized);
    assert(a.connections().empty());

    Agent no_ledger(config_for("0.0.1"), nullptr);
    assert(no_ledger.initialize().status.code == ErrorCode::ClientNotInitialized);
    std::cout << "OK" << std::endl;
}

void test_connection_before_initialize() {
    std::cout << "Test: connection before initialization... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    Agent a(config_for("0.0.1"), ledger);
    ConnectionResult r = a.create_connection_topic("0.0.2", "42");
    assert(r.status.code == ErrorCode::NotReady);
    assert(ledger->create_calls == 0);
    assert(a.connections().empty());
    std::cout << "OK" << std::endl;
}

void test_initialize_is_idempotent_and_retryable() {
    std::cout << "Test: initialize retry and idempotence... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    Agent a(config_for("0.0.1"), ledger);

    ledger->fail_create_on_call = 1;
    InitResult failed = a.initialize();
    assert(failed.status.code == ErrorCode::TopicCreationFailed);
    assert(!a.identity());
    assert(a.status().state == AgentState::Uninitialized);

    InitResult ok = a.initialize();
    assert(ok.status.ok());
    int calls = ledger->create_calls;

    InitResult again = a.initialize();
    assert(again.status.ok());
    assert(again.inbound_topic_id == ok.inbound_topic_id);
    assert(ledger->create_calls == calls);
    std::cout << "OK" << std::endl;
}

void test_invalid_network() {
    std::cout << "Test: invalid network name... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    AgentConfig config = config_for("0.0.1");
    config.network = "previewnet";
    Agent a(config, ledger);
    assert(a.initialize().status.code == ErrorCode::InvalidArgument);
    assert(ledger->create_calls == 0);
    std::cout << "OK" << std::endl;
}

void test_duplicate_connection_id() {
    std::cout << "Test: duplicate connection id is rejected... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    Agent a(config_for("0.0.1"), ledger);
    assert(a.initialize().status.ok());

    assert(a.create_connection_topic("0.0.2", "42").status.ok());
    int calls = ledger->create_calls;
    ConnectionResult dup = a.create_connection_topic("0.0.3", "42");
    assert(dup.status.code == ErrorCode::InvalidArgument);
    assert(ledger->create_calls == calls);

    // A failed creation frees the id again.
    ledger->fail_create_on_call = ledger->create_calls + 1;
    assert(a.create_connection_topic("0.0.3", "43").status.code == ErrorCode::TopicCreationFailed);
    assert(!a.find_connection("43"));
    assert(a.create_connection_topic("0.0.3", "43").status.ok());
    assert(a.connections().size() == 2);
    std::cout << "OK" << std::endl;
}

void test_status_snapshot() {
    std::cout << "Test: status snapshot... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    AgentConfig config = config_for("0.0.1");
    config.registry_topic_id = "0.0.4000";
    Agent a(config, ledger);

    Json::Value before = a.status().to_json();
    assert(before["operator_id"].asString() == "0.0.1");
    assert(before["network"].asString() == "testnet");
    assert(before["inbound_topic_id"].isNull());
    assert(before["registry_topic_id"].asString() == "0.0.4000");
    assert(before["client_initialized"].asBool());
    assert(before["state"].asString() == "uninitialized");

    assert(a.initialize().status.ok());
    assert(a.create_connection_topic("0.0.2", "42").status.ok());

    AgentStatus after = a.status();
    assert(after.inbound_topic_id && *after.inbound_topic_id == "0.0.10");
    assert(after.outbound_topic_id && *after.outbound_topic_id == "0.0.11");
    assert(after.state == AgentState::Ready);
    assert(after.connection_count == 1);
    assert(after.to_json()["state"].asString() == "ready");
    std::cout << "OK" << std::endl;
}

void test_raw_topic_access() {
    std::cout << "Test: raw topic creation and JSON submission... ";
    auto ledger = std::make_shared<InMemoryLedger>("0.0.1", 500);
    Agent a(config_for("0.0.1"), ledger);

    TopicResult t = a.create_topic("carbon-credits");
    assert(t.status.ok());
    assert(t.topic_id == "0.0.500");

    Json::Value payload(Json::objectValue);
    payload["type"] = "offer";
    payload["amount"] = 5;
    SubmitResult s1 = a.submit_message(t.topic_id, payload);
    SubmitResult s2 = a.submit_message(t.topic_id, payload, "note");
    assert(s1.status.ok() && s2.status.ok());
    assert(s1.sequence_number == 1 && s2.sequence_number == 2);
    assert(s1.transaction_id.find("0.0.1@") == 0);

    SubmitResult unknown = a.submit_message("0.0.9999", payload);
    assert(unknown.status.code == ErrorCode::SubmissionFailed);
    std::cout << "OK" << std::endl;
}

int main() {
    try {
        test_two_agent_session();
        test_unconfigured_agent();
        test_connection_before_initialize();
        test_initialize_is_idempotent_and_retryable();
        test_invalid_network();
        test_duplicate_connection_id();
        test_status_snapshot();
        test_raw_topic_access();
        std::cout << "Agent end-to-end tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
