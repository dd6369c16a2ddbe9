#pragma once

#include "agentlink/envelope.hpp"
#include "agentlink/ledger.hpp"
#include "agentlink/memo.hpp"
#include "agentlink/status.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

struct TopicRecord {
    std::string topic_id;
    std::string memo;
    std::optional<TopicRole> role;   // unset when the memo is not an hcs-10 topic memo
};

struct TopicResult {
    Status status;
    std::string topic_id;
    std::string memo;
};

struct SubmitResult {
    Status status;
    std::string topic_id;
    uint64_t sequence_number = 0;
    std::string transaction_id;
};

// Creates topics on the ledger and remembers the ones it created.
// Ledger failures are reported through Status, never retried here.
class TopicManager {
public:
    explicit TopicManager(LedgerPtr ledger);

    bool client_initialized() const;

    TopicResult create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key = std::nullopt,
                             const std::optional<KeyPolicy>& submit_key = std::nullopt);
    TopicResult create_topic(const TopicMemo& memo,
                             const std::optional<KeyPolicy>& admin_key = std::nullopt,
                             const std::optional<KeyPolicy>& submit_key = std::nullopt);

    SubmitResult submit_message(const std::string& topic_id,
                                const std::vector<uint8_t>& envelope_bytes,
                                const std::string& transaction_memo);

    // Serializes the envelope and attaches its matching transaction memo.
    SubmitResult submit(const std::string& topic_id, const Envelope& envelope);

    std::optional<TopicRecord> find_topic(const std::string& topic_id) const;
    std::vector<TopicRecord> known_topics() const;

private:
    LedgerPtr ledger_;
    mutable std::mutex mutex_;
    std::map<std::string, TopicRecord> topics_;
};

} // namespace agentlink
