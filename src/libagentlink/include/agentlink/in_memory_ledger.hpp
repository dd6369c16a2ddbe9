#pragma once

#include "agentlink/ledger.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentlink {

// Process-local ledger. Topic ids are "0.0.<n>" counting up from
// first_topic_number; every topic keeps its own sequence counter.
// Submit keys are recorded but signatures are not checked.
class InMemoryLedger : public Ledger {
public:
    struct TopicInfo {
        std::string topic_id;
        std::string memo;
        std::optional<KeyPolicy> admin_key;
        std::optional<KeyPolicy> submit_key;
        uint64_t last_sequence_number = 0;
    };

    explicit InMemoryLedger(const std::string& operator_id, uint64_t first_topic_number = 1000);
    ~InMemoryLedger() override;

    bool configured() const override;

    std::string create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key,
                             const std::optional<KeyPolicy>& submit_key) override;

    SubmitReceipt submit_message(const std::string& topic_id,
                                 const std::vector<uint8_t>& payload,
                                 const std::string& transaction_memo) override;

    std::optional<TopicInfo> topic_info(const std::string& topic_id) const;
    size_t topic_count() const;

private:
    std::string operator_id_;
    mutable std::mutex mutex_;
    std::map<std::string, TopicInfo> topics_;
    uint64_t next_topic_number_;
};

// "<operator>@<seconds>.<nanos>" from the current wall clock.
std::string make_transaction_id(const std::string& operator_id);

} // namespace agentlink
