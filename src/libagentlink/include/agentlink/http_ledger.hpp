#pragma once

#include "agentlink/ledger.hpp"
#include <json/json.h>
#include <optional>
#include <string>

namespace agentlink {

// Ledger reached through an HTTP gateway that fronts the consensus service.
//
//   POST <base>/topics                 {"memo", "admin_key"?, "submit_key"?}  -> {"topic_id"}
//   POST <base>/topics/<id>/messages   {"message", "transaction_memo"}        -> {"sequence_number", "transaction_id"}
//
// Every request carries X-Operator-Id, X-Network and X-Signature (hex Ed25519
// signature of the request body made with the operator key).
class HttpLedger : public Ledger {
public:
    struct Options {
        std::string base_url;
        std::string operator_id;
        std::string operator_key_hex;   // 32-byte seed or 64-byte secret key
        std::string network = "testnet";
        long timeout_seconds = 30;
        long connect_timeout_seconds = 5;
        bool verify_tls = true;
    };

    explicit HttpLedger(const Options& options);
    ~HttpLedger() override;

    bool configured() const override;

    std::string create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key,
                             const std::optional<KeyPolicy>& submit_key) override;

    SubmitReceipt submit_message(const std::string& topic_id,
                                 const std::vector<uint8_t>& payload,
                                 const std::string& transaction_memo) override;

private:
    // POSTs the body and returns the parsed JSON response. Throws LedgerError
    // on transport failures, non-2xx codes and {"success": false} bodies.
    Json::Value post_json(const std::string& path, const Json::Value& body);

    Options options_;
    std::optional<KeyPair> operator_key_;
};

// Percent-encodes one URL path segment ("/" included). Throws LedgerError if
// libcurl cannot encode it.
std::string escape_path_segment(const std::string& segment);

} // namespace agentlink
