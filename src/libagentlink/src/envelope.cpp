#include "agentlink/envelope.hpp"
#include <cstdint>

namespace agentlink {

namespace {
    // Reserved keys written by the envelope itself; payload fields may not shadow them.
    bool is_reserved_key(const std::string& key) {
        return key == "p" || key == "op" || key == "operator_id" || key == "m";
    }

    // Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
    bool is_valid_utf8(const std::string& text) {
        const auto* p = reinterpret_cast<const unsigned char*>(text.data());
        const auto* end = p + text.size();
        while (p < end) {
            unsigned char c = *p;
            size_t len;
            uint32_t cp;
            if (c < 0x80) { ++p; continue; }
            else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            else return false;

            if (static_cast<size_t>(end - p) < len) return false;
            for (size_t i = 1; i < len; ++i) {
                if ((p[i] & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (p[i] & 0x3F);
            }
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
                return false;
            p += len;
        }
        return true;
    }

    void require_utf8(const std::string& key, const std::string& value) {
        if (!is_valid_utf8(key) || !is_valid_utf8(value))
            throw EnvelopeError("field '" + key + "' is not valid UTF-8");
    }
}

std::string Envelope::composite_operator_id(const std::string& local_account_id,
                                            const std::string& remote_account_id) {
    return local_account_id + "@" + remote_account_id;
}

Envelope Envelope::make_register(const std::string& account_id, const std::string& note) {
    Envelope env;
    env.operation = Operation::Register;
    env.fields["account_id"] = account_id;
    env.note = note;
    return env;
}

Envelope Envelope::make_connection_created(const std::string& connection_topic_id,
                                           const std::string& local_account_id,
                                           const std::string& remote_account_id,
                                           const std::string& connection_id) {
    Envelope env;
    env.operation = Operation::ConnectionCreated;
    env.operator_id = composite_operator_id(local_account_id, remote_account_id);
    env.fields["connection_topic_id"] = connection_topic_id;
    env.fields["connected_account_id"] = remote_account_id;
    env.fields["connection_id"] = connection_id;
    env.note = "Connection established.";
    return env;
}

Envelope Envelope::make_message(const std::string& local_account_id,
                                const std::string& remote_account_id,
                                const std::string& content) {
    Envelope env;
    env.operation = Operation::Message;
    env.operator_id = composite_operator_id(local_account_id, remote_account_id);
    env.fields["data"] = content;
    env.note = "Standard communication.";
    return env;
}

Envelope Envelope::make_transaction(const std::string& local_account_id,
                                    const std::string& remote_account_id,
                                    const std::string& schedule_id,
                                    const std::string& transaction_data) {
    Envelope env;
    env.operation = Operation::Transaction;
    env.operator_id = composite_operator_id(local_account_id, remote_account_id);
    env.fields["schedule_id"] = schedule_id;
    env.fields["data"] = transaction_data;
    env.note = "For your approval.";
    return env;
}

std::string Envelope::field(const std::string& key) const {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

Json::Value Envelope::to_json() const {
    Json::Value out(Json::objectValue);
    out["p"] = PROTOCOL_MARKER;
    out["op"] = operation_name(operation);
    if (!operator_id.empty()) {
        require_utf8("operator_id", operator_id);
        out["operator_id"] = operator_id;
    }
    for (const auto& kv : fields) {
        if (is_reserved_key(kv.first))
            throw EnvelopeError("payload field '" + kv.first + "' is reserved");
        require_utf8(kv.first, kv.second);
        out[kv.first] = kv.second;
    }
    require_utf8("m", note);
    out["m"] = note;
    return out;
}

Envelope Envelope::from_json(const Json::Value& value) {
    if (!value.isObject())
        throw EnvelopeError("not a JSON object");
    if (!value["p"].isString() || value["p"].asString() != PROTOCOL_MARKER)
        throw EnvelopeError("missing or unknown protocol marker");
    if (!value["op"].isString())
        throw EnvelopeError("missing operation");

    Envelope env;
    if (!operation_from_name(value["op"].asString(), env.operation))
        throw EnvelopeError("unknown operation '" + value["op"].asString() + "'");

    for (const auto& key : value.getMemberNames()) {
        const Json::Value& v = value[key];
        if (key == "p" || key == "op") continue;
        if (!v.isString() && !v.isNumeric() && !v.isBool())
            throw EnvelopeError("field '" + key + "' is not a scalar");
        if (key == "operator_id") env.operator_id = v.asString();
        else if (key == "m") env.note = v.asString();
        else env.fields[key] = v.asString();
    }
    return env;
}

std::vector<uint8_t> Envelope::serialize() const {
    std::string text = write_json(to_json());
    return std::vector<uint8_t>(text.begin(), text.end());
}

Envelope Envelope::deserialize(const std::vector<uint8_t>& input) {
    Json::Value value;
    std::string errs;
    std::string text(input.begin(), input.end());
    if (!parse_json(text, value, &errs))
        throw EnvelopeError("invalid JSON: " + errs);
    return from_json(value);
}

} // namespace agentlink
