#include "agentlink/in_memory_ledger.hpp"
#include "agentlink/log.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace agentlink {

std::string make_transaction_id(const std::string& operator_id) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now - secs);
    std::ostringstream out;
    out << operator_id << "@" << secs.count() << "."
        << std::setfill('0') << std::setw(9) << nanos.count();
    return out.str();
}

InMemoryLedger::InMemoryLedger(const std::string& operator_id, uint64_t first_topic_number)
    : operator_id_(operator_id), next_topic_number_(first_topic_number) {
    log::debug("InMemoryLedger", "created for operator " + operator_id_);
}

InMemoryLedger::~InMemoryLedger() = default;

bool InMemoryLedger::configured() const {
    return !operator_id_.empty();
}

std::string InMemoryLedger::create_topic(const std::string& memo,
                                         const std::optional<KeyPolicy>& admin_key,
                                         const std::optional<KeyPolicy>& submit_key) {
    std::lock_guard<std::mutex> lk(mutex_);
    TopicInfo info;
    info.topic_id = "0.0." + std::to_string(next_topic_number_++);
    info.memo = memo;
    info.admin_key = admin_key;
    info.submit_key = submit_key;
    topics_[info.topic_id] = info;
    log::debug("InMemoryLedger", "topic " + info.topic_id + " memo=" + memo);
    return info.topic_id;
}

SubmitReceipt InMemoryLedger::submit_message(const std::string& topic_id,
                                             const std::vector<uint8_t>& payload,
                                             const std::string& transaction_memo) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = topics_.find(topic_id);
    if (it == topics_.end()) {
        throw LedgerError("INVALID_TOPIC_ID");
    }

    SubmitReceipt receipt;
    receipt.sequence_number = ++it->second.last_sequence_number;
    receipt.transaction_id = make_transaction_id(operator_id_);
    log::debug("InMemoryLedger", "topic " + topic_id + " seq=" +
               std::to_string(receipt.sequence_number) + " bytes=" +
               std::to_string(payload.size()) + " memo=" + transaction_memo);
    return receipt;
}

std::optional<InMemoryLedger::TopicInfo> InMemoryLedger::topic_info(const std::string& topic_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = topics_.find(topic_id);
    if (it == topics_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryLedger::topic_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return topics_.size();
}

} // namespace agentlink
