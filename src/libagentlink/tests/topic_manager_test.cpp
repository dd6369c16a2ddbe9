#include "agentlink/topic_manager.hpp"
#include "agentlink/directory.hpp"
#include "agentlink/dispatcher.hpp"
#include "fake_ledger.hpp"
#include <iostream>
#include <cassert>
#include <memory>

using namespace agentlink;
using agentlink::testing::FakeLedger;

void test_unconfigured_client_never_calls_ledger() {
    std::cout << "Test: unconfigured client... ";
    auto ledger = std::make_shared<FakeLedger>(10, false);
    TopicManager topics(ledger);
    assert(!topics.client_initialized());

    TopicResult t = topics.create_topic(TopicMemo::outbound(60));
    assert(t.status.code == ErrorCode::ClientNotInitialized);

    SubmitResult s = topics.submit("0.0.10", Envelope::make_message("0.0.1", "0.0.2", "x"));
    assert(s.status.code == ErrorCode::ClientNotInitialized);

    Dispatcher dispatcher(topics, "0.0.1");
    assert(dispatcher.send_message("0.0.10", "0.0.2", "x").status.code == ErrorCode::ClientNotInitialized);

    assert(ledger->create_calls == 0);
    assert(ledger->submit_calls == 0);

    TopicManager null_client(nullptr);
    assert(!null_client.client_initialized());
    assert(null_client.create_topic("memo").status.code == ErrorCode::ClientNotInitialized);
    std::cout << "OK" << std::endl;
}

void test_create_records_topic() {
    std::cout << "Test: topic creation is recorded... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    TopicManager topics(ledger);

    TopicResult t = topics.create_topic(TopicMemo::inbound(60, "0.0.1"));
    assert(t.status.ok());
    assert(t.topic_id == "0.0.10");
    assert(t.memo == "hcs-10:0:60:0:0.0.1");

    auto record = topics.find_topic("0.0.10");
    assert(record);
    assert(record->role && *record->role == TopicRole::Inbound);

    TopicResult raw = topics.create_topic("plain memo");
    assert(raw.status.ok());
    auto raw_record = topics.find_topic(raw.topic_id);
    assert(raw_record && !raw_record->role);

    assert(topics.known_topics().size() == 2);
    assert(!topics.find_topic("0.0.999"));
    std::cout << "OK" << std::endl;
}

void test_failure_mapping() {
    std::cout << "Test: ledger failures map to status codes... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    TopicManager topics(ledger);

    ledger->fail_create_on_call = 1;
    ledger->failure_status = "INSUFFICIENT_PAYER_BALANCE";
    TopicResult t = topics.create_topic(TopicMemo::outbound(60));
    assert(t.status.code == ErrorCode::TopicCreationFailed);
    assert(t.status.message == "INSUFFICIENT_PAYER_BALANCE");
    assert(t.topic_id.empty());
    assert(topics.known_topics().empty());

    ledger->reject_submissions_to.insert("0.0.77");
    ledger->failure_status = "INVALID_SIGNATURE";
    SubmitResult s = topics.submit("0.0.77", Envelope::make_message("0.0.1", "0.0.2", "x"));
    assert(s.status.code == ErrorCode::SubmissionFailed);
    assert(s.status.to_string() == "SubmissionFailed: INVALID_SIGNATURE");

    ledger->throw_unexpected = true;
    TopicResult u = topics.create_topic(TopicMemo::outbound(60));
    assert(u.status.code == ErrorCode::Internal);
    std::cout << "OK" << std::endl;
}

void test_submit_attaches_transaction_memo() {
    std::cout << "Test: submit attaches matching transaction memo... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    TopicManager topics(ledger);

    SubmitResult first = topics.submit("0.0.50", Envelope::make_transaction("0.0.1", "0.0.2", "0.0.9", "d"));
    SubmitResult second = topics.submit("0.0.50", Envelope::make_message("0.0.1", "0.0.2", "m"));
    assert(first.status.ok() && second.status.ok());
    assert(first.sequence_number == 1);
    assert(second.sequence_number == 2);
    assert(!first.transaction_id.empty());
    assert(ledger->submissions[0].transaction_memo == "hcs-10:op:7:3");
    assert(ledger->submissions[1].transaction_memo == "hcs-10:op:6:3");

    SubmitResult empty = topics.submit("", Envelope::make_message("0.0.1", "0.0.2", "m"));
    assert(empty.status.code == ErrorCode::InvalidArgument);
    SubmitResult binary = topics.submit("0.0.50", Envelope::make_message("0.0.1", "0.0.2", "a\xff\xfe" "b"));
    assert(binary.status.code == ErrorCode::InvalidArgument);
    assert(ledger->submit_calls == 2);
    std::cout << "OK" << std::endl;
}

void test_bad_topic_memo_is_not_sent() {
    std::cout << "Test: invalid memo never reaches the ledger... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    TopicManager topics(ledger);
    TopicResult t = topics.create_topic(TopicMemo::connection(60, "0.0.1", "bad:id"));
    assert(t.status.code == ErrorCode::MalformedMemo);
    assert(ledger->create_calls == 0);
    std::cout << "OK" << std::endl;
}

void test_directory_registration() {
    std::cout << "Test: registry registration... ";
    auto ledger = std::make_shared<FakeLedger>(10);
    TopicManager topics(ledger);

    AgentDirectory none(topics, std::string());
    RegisterResult skipped = none.register_agent("0.0.1");
    assert(skipped.skipped);
    assert(ledger->submit_calls == 0);

    AgentDirectory registry(topics, std::string("0.0.4000"));
    RegisterResult r = registry.register_agent("0.0.1");
    assert(!r.skipped && r.status.ok());
    assert(r.sequence_number == 1);
    Envelope env = ledger->envelope_at(0);
    assert(env.operation == Operation::Register);
    assert(env.field("account_id") == "0.0.1");
    assert(ledger->submissions[0].transaction_memo == "hcs-10:op:0:0");

    ledger->reject_submissions_to.insert("0.0.4000");
    RegisterResult failed = registry.register_agent("0.0.1");
    assert(!failed.skipped);
    assert(failed.status.code == ErrorCode::SubmissionFailed);
    std::cout << "OK" << std::endl;
}

int main() {
    try {
        test_unconfigured_client_never_calls_ledger();
        test_create_records_topic();
        test_failure_mapping();
        test_submit_attaches_transaction_memo();
        test_bad_topic_memo_is_not_sent();
        test_directory_registration();
        std::cout << "TopicManager tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
