#pragma once

#include "agentlink/json_util.hpp"
#include "agentlink/memo.hpp"
#include "agentlink/status.hpp"
#include <json/json.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace agentlink {

class EnvelopeError : public Error {
public:
    explicit EnvelopeError(const std::string& what)
        : Error(ErrorCode::InvalidArgument, "Envelope: " + what) {}
};

class Envelope {
public:
    // Data fields (POD-like for easy access)
    Operation operation = Operation::Message;
    std::string operator_id;                        // "<local>@<remote>", empty if not applicable
    std::map<std::string, std::string> fields;      // operation specific payload
    std::string note;                               // "m": short human readable note

    static Envelope make_register(const std::string& account_id,
                                  const std::string& note = "Registering agent.");
    static Envelope make_connection_created(const std::string& connection_topic_id,
                                            const std::string& local_account_id,
                                            const std::string& remote_account_id,
                                            const std::string& connection_id);
    static Envelope make_message(const std::string& local_account_id,
                                 const std::string& remote_account_id,
                                 const std::string& content);
    static Envelope make_transaction(const std::string& local_account_id,
                                     const std::string& remote_account_id,
                                     const std::string& schedule_id,
                                     const std::string& transaction_data);

    static std::string composite_operator_id(const std::string& local_account_id,
                                             const std::string& remote_account_id);

    // Empty string when the field is absent.
    std::string field(const std::string& key) const;

    // Memo that must accompany this envelope on submission.
    TransactionMemo transaction_memo() const { return TransactionMemo::for_operation(operation); }

    Json::Value to_json() const;
    static Envelope from_json(const Json::Value& value);

    // Compact JSON bytes as submitted to the ledger.
    std::vector<uint8_t> serialize() const;
    static Envelope deserialize(const std::vector<uint8_t>& input);
};

} // namespace agentlink
