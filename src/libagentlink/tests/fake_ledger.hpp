#pragma once

#include "agentlink/envelope.hpp"
#include "agentlink/ledger.hpp"
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentlink {
namespace testing {

// Scriptable ledger double: counts calls, records every request and injects failures.
class FakeLedger : public Ledger {
public:
    struct CreatedTopic {
        std::string topic_id;
        std::string memo;
        std::optional<KeyPolicy> admin_key;
        std::optional<KeyPolicy> submit_key;
    };

    struct Submission {
        std::string topic_id;
        std::vector<uint8_t> payload;
        std::string transaction_memo;
        uint64_t sequence_number;
    };

    explicit FakeLedger(uint64_t first_topic_number = 10, bool is_configured = true)
        : next_topic_(first_topic_number), configured_(is_configured) {}

    bool configured() const override { return configured_; }

    std::string create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key,
                             const std::optional<KeyPolicy>& submit_key) override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++create_calls;
        if (fail_create_on_call == create_calls)
            throw LedgerError(failure_status);
        if (throw_unexpected)
            throw std::runtime_error("unexpected fault");

        CreatedTopic t{"0.0." + std::to_string(next_topic_++), memo, admin_key, submit_key};
        topics.push_back(t);
        return t.topic_id;
    }

    SubmitReceipt submit_message(const std::string& topic_id,
                                 const std::vector<uint8_t>& payload,
                                 const std::string& transaction_memo) override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++submit_calls;
        if (reject_submissions_to.count(topic_id))
            throw LedgerError(failure_status);

        SubmitReceipt receipt;
        receipt.sequence_number = ++sequence_[topic_id];
        receipt.transaction_id = "0.0.2@1700000000." + std::to_string(submit_calls);
        submissions.push_back({topic_id, payload, transaction_memo, receipt.sequence_number});
        return receipt;
    }

    Envelope envelope_at(size_t index) const {
        return Envelope::deserialize(submissions.at(index).payload);
    }

    int create_calls = 0;
    int submit_calls = 0;
    int fail_create_on_call = 0;            // 1-based; 0 never fails
    bool throw_unexpected = false;
    std::set<std::string> reject_submissions_to;
    std::string failure_status = "INVALID_SIGNATURE";

    std::vector<CreatedTopic> topics;
    std::vector<Submission> submissions;

private:
    std::mutex mutex_;
    uint64_t next_topic_;
    bool configured_;
    std::map<std::string, uint64_t> sequence_;
};

} // namespace testing
} // namespace agentlink
