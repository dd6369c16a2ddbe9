#pragma once

#include "agentlink/ledger.hpp"
#include "agentlink/log.hpp"
#include "agentlink/memo.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace agentlink {

enum class Network {
    Testnet,
    Mainnet
};

const char* network_name(Network network);

// "testnet"/"test" and "mainnet"/"production"; case-sensitive like the SDK.
bool parse_network(const std::string& name, Network& out);

enum class LedgerKind {
    Memory,
    Sqlite,
    Http
};

bool parse_ledger_kind(const std::string& name, LedgerKind& out);

struct AgentConfig {
    std::string operator_id;
    std::string operator_key;                   // hex Ed25519 seed / secret key
    std::string network = "testnet";            // validated by network_kind()
    std::optional<std::string> registry_topic_id;
    uint32_t ttl_seconds = DEFAULT_TOPIC_TTL;

    LedgerKind ledger = LedgerKind::Http;        // memory / sqlite are local opt-ins
    std::string ledger_url;                     // HttpLedger gateway
    std::string db_path = "./agentlink_ledger.db";
    uint64_t first_topic_number = 1000;         // in-memory / sqlite topic numbering

    LogLevel log_level = LogLevel::Info;

    std::optional<Network> network_kind() const;

    // HEDERA_NETWORK, HEDERA_OPERATOR_ID, HEDERA_OPERATOR_KEY, HCS_REGISTRY_TOPIC_ID,
    // HCS_TOPIC_TTL, AGENTLINK_LEDGER, AGENTLINK_LEDGER_URL, AGENTLINK_DB_PATH,
    // AGENTLINK_LOG_LEVEL
    static AgentConfig from_env();
};

// Builds the configured backend. Returns nullptr (an unconfigured client) when
// the network is unknown, the operator id or key is missing, a local backend
// (memory / sqlite) is requested on mainnet, or the SQLite database cannot be
// opened.
LedgerPtr make_ledger(const AgentConfig& config);

} // namespace agentlink
