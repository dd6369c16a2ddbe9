#pragma once

#include "agentlink/status.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace agentlink {

// Marker that opens every topic memo, transaction memo and envelope.
constexpr const char* PROTOCOL_MARKER = "hcs-10";
constexpr uint32_t DEFAULT_TOPIC_TTL = 60;

enum class TopicRole : uint8_t {
    Inbound = 0,
    Outbound = 1,
    Connection = 2
};

enum class Operation : uint8_t {
    Register = 0,
    ConnectionCreated = 4,
    Message = 6,
    Transaction = 7
};

const char* topic_role_name(TopicRole role);

// Wire name used in the envelope "op" field.
const char* operation_name(Operation op);
bool operation_from_name(const std::string& name, Operation& out);
bool operation_from_code(uint32_t code, Operation& out);

// Payload shape revision carried in the transaction memo of each operation.
uint32_t operation_version(Operation op);

class MemoError : public Error {
public:
    explicit MemoError(const std::string& what)
        : Error(ErrorCode::MalformedMemo, "malformed memo: " + what) {}
};

// hcs-10:<auth-flag>:<ttl-seconds>:<role-code>[:<ref>...]
struct TopicMemo {
    bool dual_control = false;
    uint32_t ttl_seconds = DEFAULT_TOPIC_TTL;
    TopicRole role = TopicRole::Inbound;
    std::vector<std::string> refs;

    static TopicMemo inbound(uint32_t ttl, const std::string& operator_id);
    static TopicMemo outbound(uint32_t ttl);
    static TopicMemo connection(uint32_t ttl,
                                const std::string& initiator_inbound_topic_id,
                                const std::string& connection_id);

    // Number of trailing refs a role must carry.
    static size_t required_refs(TopicRole role);

    std::string encode() const;
    static TopicMemo decode(const std::string& memo);

    bool operator==(const TopicMemo& other) const;
    bool operator!=(const TopicMemo& other) const { return !(*this == other); }
};

// hcs-10:op:<operation-code>:<version>
struct TransactionMemo {
    Operation operation = Operation::Message;
    uint32_t version = 0;

    static TransactionMemo for_operation(Operation op);

    std::string encode() const;
    static TransactionMemo decode(const std::string& memo);
};

} // namespace agentlink
