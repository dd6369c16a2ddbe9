#include "agentlink/memo.hpp"
#include <cctype>
#include <limits>
#include <sstream>

namespace agentlink {

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Canonical unsigned decimal: digits only, no sign, no leading zeros, fits in 32 bits.
uint32_t parse_u32(const std::string& field, const char* what) {
    if (field.empty() || field.size() > 10)
        throw MemoError(std::string(what) + " is not a number: '" + field + "'");
    if (field.size() > 1 && field[0] == '0')
        throw MemoError(std::string(what) + " has leading zeros: '" + field + "'");
    uint64_t v = 0;
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw MemoError(std::string(what) + " is not a number: '" + field + "'");
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    if (v > std::numeric_limits<uint32_t>::max())
        throw MemoError(std::string(what) + " out of range: '" + field + "'");
    return static_cast<uint32_t>(v);
}

} // namespace

const char* topic_role_name(TopicRole role) {
    switch (role) {
        case TopicRole::Inbound:    return "inbound";
        case TopicRole::Outbound:   return "outbound";
        case TopicRole::Connection: return "connection";
        default:                    return "unknown";
    }
}

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Register:          return "register";
        case Operation::ConnectionCreated: return "connection_created";
        case Operation::Message:           return "message";
        case Operation::Transaction:       return "transaction";
        default:                           return "unknown";
    }
}

bool operation_from_name(const std::string& name, Operation& out) {
    for (Operation op : {Operation::Register, Operation::ConnectionCreated,
                         Operation::Message, Operation::Transaction}) {
        if (name == operation_name(op)) {
            out = op;
            return true;
        }
    }
    return false;
}

bool operation_from_code(uint32_t code, Operation& out) {
    switch (code) {
        case 0: out = Operation::Register; return true;
        case 4: out = Operation::ConnectionCreated; return true;
        case 6: out = Operation::Message; return true;
        case 7: out = Operation::Transaction; return true;
        default: return false;
    }
}

uint32_t operation_version(Operation op) {
    switch (op) {
        case Operation::Register:          return 0;
        case Operation::ConnectionCreated: return 1;
        case Operation::Message:           return 3;
        case Operation::Transaction:       return 3;
        default:                           return 0;
    }
}

TopicMemo TopicMemo::inbound(uint32_t ttl, const std::string& operator_id) {
    TopicMemo m;
    m.dual_control = false;
    m.ttl_seconds = ttl;
    m.role = TopicRole::Inbound;
    m.refs = {operator_id};
    return m;
}

TopicMemo TopicMemo::outbound(uint32_t ttl) {
    TopicMemo m;
    m.dual_control = false;
    m.ttl_seconds = ttl;
    m.role = TopicRole::Outbound;
    return m;
}

TopicMemo TopicMemo::connection(uint32_t ttl,
                                const std::string& initiator_inbound_topic_id,
                                const std::string& connection_id) {
    TopicMemo m;
    m.dual_control = true;
    m.ttl_seconds = ttl;
    m.role = TopicRole::Connection;
    m.refs = {initiator_inbound_topic_id, connection_id};
    return m;
}

size_t TopicMemo::required_refs(TopicRole role) {
    switch (role) {
        case TopicRole::Inbound:    return 1;
        case TopicRole::Connection: return 2;
        default:                    return 0;
    }
}

std::string TopicMemo::encode() const {
    if (refs.size() != required_refs(role)) {
        std::ostringstream err;
        err << topic_role_name(role) << " topic needs " << required_refs(role)
            << " ref(s), got " << refs.size();
        throw MemoError(err.str());
    }

    std::ostringstream out;
    out << PROTOCOL_MARKER << ':' << (dual_control ? 1 : 0) << ':' << ttl_seconds
        << ':' << static_cast<unsigned>(role);
    for (const auto& ref : refs) {
        if (ref.empty() || ref.find(':') != std::string::npos)
            throw MemoError("invalid ref '" + ref + "'");
        out << ':' << ref;
    }
    return out.str();
}

TopicMemo TopicMemo::decode(const std::string& memo) {
    auto parts = split(memo, ':');
    if (parts.size() < 4)
        throw MemoError("too few fields in '" + memo + "'");
    if (parts[0] != PROTOCOL_MARKER)
        throw MemoError("unknown protocol marker '" + parts[0] + "'");

    TopicMemo m;

    uint32_t flag = parse_u32(parts[1], "auth flag");
    if (flag > 1)
        throw MemoError("auth flag must be 0 or 1, got " + parts[1]);
    m.dual_control = (flag == 1);

    m.ttl_seconds = parse_u32(parts[2], "ttl");

    uint32_t role = parse_u32(parts[3], "role code");
    if (role > static_cast<uint32_t>(TopicRole::Connection))
        throw MemoError("unknown role code " + parts[3]);
    m.role = static_cast<TopicRole>(role);

    m.refs.assign(parts.begin() + 4, parts.end());
    if (m.refs.size() != required_refs(m.role)) {
        std::ostringstream err;
        err << topic_role_name(m.role) << " memo needs " << required_refs(m.role)
            << " ref(s), got " << m.refs.size();
        throw MemoError(err.str());
    }
    for (const auto& ref : m.refs) {
        if (ref.empty())
            throw MemoError("empty ref in '" + memo + "'");
    }
    return m;
}

bool TopicMemo::operator==(const TopicMemo& other) const {
    return dual_control == other.dual_control &&
           ttl_seconds == other.ttl_seconds &&
           role == other.role &&
           refs == other.refs;
}

TransactionMemo TransactionMemo::for_operation(Operation op) {
    TransactionMemo m;
    m.operation = op;
    m.version = operation_version(op);
    return m;
}

std::string TransactionMemo::encode() const {
    std::ostringstream out;
    out << PROTOCOL_MARKER << ":op:" << static_cast<unsigned>(operation) << ':' << version;
    return out.str();
}

TransactionMemo TransactionMemo::decode(const std::string& memo) {
    auto parts = split(memo, ':');
    if (parts.size() != 4)
        throw MemoError("transaction memo needs 4 fields: '" + memo + "'");
    if (parts[0] != PROTOCOL_MARKER)
        throw MemoError("unknown protocol marker '" + parts[0] + "'");
    if (parts[1] != "op")
        throw MemoError("expected 'op' tag, got '" + parts[1] + "'");

    TransactionMemo m;
    uint32_t code = parse_u32(parts[2], "operation code");
    if (!operation_from_code(code, m.operation))
        throw MemoError("unknown operation code " + parts[2]);
    m.version = parse_u32(parts[3], "version");
    if (m.version != operation_version(m.operation))
        throw MemoError(std::string(operation_name(m.operation)) + " expects version " +
                        std::to_string(operation_version(m.operation)) + ", got " + parts[3]);
    return m;
}

} // namespace agentlink
