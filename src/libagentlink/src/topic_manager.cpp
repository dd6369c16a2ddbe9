#include "agentlink/topic_manager.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

TopicManager::TopicManager(LedgerPtr ledger)
    : ledger_(std::move(ledger)) {}

bool TopicManager::client_initialized() const {
    return ledger_ && ledger_->configured();
}

TopicResult TopicManager::create_topic(const TopicMemo& memo,
                                       const std::optional<KeyPolicy>& admin_key,
                                       const std::optional<KeyPolicy>& submit_key) {
    std::string encoded;
    try {
        encoded = memo.encode();
    } catch (const MemoError& e) {
        TopicResult result;
        result.status = Status::failure(ErrorCode::MalformedMemo, e.what());
        return result;
    }
    return create_topic(encoded, admin_key, submit_key);
}

TopicResult TopicManager::create_topic(const std::string& memo,
                                       const std::optional<KeyPolicy>& admin_key,
                                       const std::optional<KeyPolicy>& submit_key) {
    TopicResult result;
    result.memo = memo;

    if (!client_initialized()) {
        result.status = Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
        return result;
    }

    try {
        result.topic_id = ledger_->create_topic(memo, admin_key, submit_key);
    } catch (const LedgerError& e) {
        log::error("TopicManager", "Error creating topic: " + e.status());
        result.status = Status::failure(ErrorCode::TopicCreationFailed, e.status());
        return result;
    } catch (const std::exception& e) {
        log::error("TopicManager", std::string("Unexpected error creating topic: ") + e.what());
        result.status = Status::failure(ErrorCode::Internal, e.what());
        return result;
    }

    TopicRecord record;
    record.topic_id = result.topic_id;
    record.memo = memo;
    try {
        record.role = TopicMemo::decode(memo).role;
    } catch (const MemoError&) {
        // Raw memos are allowed; they just carry no role.
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        topics_[record.topic_id] = record;
    }

    log::info("TopicManager", "Topic created: " + result.topic_id);
    return result;
}

SubmitResult TopicManager::submit_message(const std::string& topic_id,
                                          const std::vector<uint8_t>& envelope_bytes,
                                          const std::string& transaction_memo) {
    SubmitResult result;
    result.topic_id = topic_id;

    if (!client_initialized()) {
        result.status = Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
        return result;
    }
    if (topic_id.empty()) {
        result.status = Status::failure(ErrorCode::InvalidArgument, "topic id is empty");
        return result;
    }

    try {
        SubmitReceipt receipt = ledger_->submit_message(topic_id, envelope_bytes, transaction_memo);
        result.sequence_number = receipt.sequence_number;
        result.transaction_id = receipt.transaction_id;
    } catch (const LedgerError& e) {
        log::error("TopicManager", "Failed to submit message to " + topic_id + ": " + e.status());
        result.status = Status::failure(ErrorCode::SubmissionFailed, e.status());
        return result;
    } catch (const std::exception& e) {
        log::error("TopicManager", std::string("Unexpected error submitting message: ") + e.what());
        result.status = Status::failure(ErrorCode::Internal, e.what());
        return result;
    }

    log::info("TopicManager", "Message submitted to topic " + topic_id +
              " seq=" + std::to_string(result.sequence_number));
    return result;
}

SubmitResult TopicManager::submit(const std::string& topic_id, const Envelope& envelope) {
    std::vector<uint8_t> bytes;
    try {
        bytes = envelope.serialize();
    } catch (const Error& e) {
        SubmitResult result;
        result.topic_id = topic_id;
        result.status = Status::failure(e.code(), e.what());
        return result;
    }
    return submit_message(topic_id, bytes, envelope.transaction_memo().encode());
}

std::optional<TopicRecord> TopicManager::find_topic(const std::string& topic_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = topics_.find(topic_id);
    if (it == topics_.end()) return std::nullopt;
    return it->second;
}

std::vector<TopicRecord> TopicManager::known_topics() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<TopicRecord> out;
    out.reserve(topics_.size());
    for (const auto& kv : topics_) out.push_back(kv.second);
    return out;
}

} // namespace agentlink
