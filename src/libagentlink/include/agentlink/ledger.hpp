#pragma once

#include "agentlink/keys.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentlink {

// Raised by a ledger backend when the ledger rejects a request or cannot be reached.
// status() carries the ledger's own status string (e.g. "INVALID_SIGNATURE").
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& status)
        : std::runtime_error(status), status_(status) {}

    const std::string& status() const { return status_; }

private:
    std::string status_;
};

struct SubmitReceipt {
    uint64_t sequence_number = 0;   // per topic, assigned by the ledger
    std::string transaction_id;
};

// Boundary to the consensus log. Both calls block until the ledger has reached
// finality for the request.
class Ledger {
public:
    virtual ~Ledger() = default;

    // False when no credentials / client are available. Callers must not
    // issue requests against an unconfigured ledger.
    virtual bool configured() const = 0;

    // Returns the new topic id.
    virtual std::string create_topic(const std::string& memo,
                                     const std::optional<KeyPolicy>& admin_key,
                                     const std::optional<KeyPolicy>& submit_key) = 0;

    virtual SubmitReceipt submit_message(const std::string& topic_id,
                                         const std::vector<uint8_t>& payload,
                                         const std::string& transaction_memo) = 0;
};

using LedgerPtr = std::shared_ptr<Ledger>;

} // namespace agentlink
