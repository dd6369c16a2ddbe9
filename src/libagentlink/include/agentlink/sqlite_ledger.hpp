#pragma once

#include "agentlink/ledger.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentlink {

// Ledger persisted in a local SQLite database. Topic ids and per-topic
// sequence numbers survive restarts, which makes it usable as a standalone
// ledger for a single host.
class SqliteLedger : public Ledger {
public:
    struct TopicInfo {
        std::string topic_id;
        std::string memo;
        std::string admin_key;      // JSON KeyPolicy, empty if none
        std::string submit_key;     // JSON KeyPolicy, empty if none
        uint64_t last_sequence_number = 0;
    };

    struct Stats {
        int topic_count;
        int message_count;
    };

    SqliteLedger(const std::string& operator_id, uint64_t first_topic_number = 1000);
    ~SqliteLedger() override;

    // Opens (or creates) the database. Returns false on failure.
    bool initialize(const std::string& db_path);

    bool configured() const override;

    std::string create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key,
                             const std::optional<KeyPolicy>& submit_key) override;

    SubmitReceipt submit_message(const std::string& topic_id,
                                 const std::vector<uint8_t>& payload,
                                 const std::string& transaction_memo) override;

    std::optional<TopicInfo> topic_info(const std::string& topic_id) const;
    Stats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string operator_id_;
    uint64_t first_topic_number_;
    mutable std::mutex mutex_;
};

} // namespace agentlink
