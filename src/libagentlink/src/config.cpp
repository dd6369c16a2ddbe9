#include "agentlink/config.hpp"
#include "agentlink/http_ledger.hpp"
#include "agentlink/in_memory_ledger.hpp"
#include "agentlink/sqlite_ledger.hpp"
#include <cstdlib>
#include <limits>

namespace agentlink {

namespace {
    std::string env_or(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : fallback;
    }

    bool parse_u64(const std::string& text, uint64_t& out) {
        if (text.empty()) return false;
        uint64_t v = 0;
        for (char c : text) {
            if (c < '0' || c > '9') return false;
            if (v > (std::numeric_limits<uint64_t>::max() - 9) / 10) return false;
            v = v * 10 + static_cast<uint64_t>(c - '0');
        }
        out = v;
        return true;
    }
}

const char* network_name(Network network) {
    switch (network) {
        case Network::Testnet: return "testnet";
        case Network::Mainnet: return "mainnet";
        default:               return "unknown";
    }
}

bool parse_network(const std::string& name, Network& out) {
    if (name == "testnet" || name == "test") {
        out = Network::Testnet;
        return true;
    }
    if (name == "mainnet" || name == "production") {
        out = Network::Mainnet;
        return true;
    }
    return false;
}

bool parse_ledger_kind(const std::string& name, LedgerKind& out) {
    if (name == "memory") out = LedgerKind::Memory;
    else if (name == "sqlite") out = LedgerKind::Sqlite;
    else if (name == "http") out = LedgerKind::Http;
    else return false;
    return true;
}

std::optional<Network> AgentConfig::network_kind() const {
    Network n;
    if (!parse_network(network, n)) return std::nullopt;
    return n;
}

AgentConfig AgentConfig::from_env() {
    AgentConfig config;
    config.network = env_or("HEDERA_NETWORK", "testnet");
    config.operator_id = env_or("HEDERA_OPERATOR_ID", "");
    config.operator_key = env_or("HEDERA_OPERATOR_KEY", "");

    std::string registry = env_or("HCS_REGISTRY_TOPIC_ID", "");
    if (!registry.empty()) config.registry_topic_id = registry;

    std::string ttl = env_or("HCS_TOPIC_TTL", "");
    if (!ttl.empty()) {
        uint64_t v = 0;
        if (parse_u64(ttl, v) && v <= std::numeric_limits<uint32_t>::max()) {
            config.ttl_seconds = static_cast<uint32_t>(v);
        } else {
            log::warn("Config", "Ignoring invalid HCS_TOPIC_TTL '" + ttl + "'");
        }
    }

    std::string ledger = env_or("AGENTLINK_LEDGER", "http");
    if (!parse_ledger_kind(ledger, config.ledger)) {
        log::warn("Config", "Unknown AGENTLINK_LEDGER '" + ledger + "', using http");
        config.ledger = LedgerKind::Http;
    }
    config.ledger_url = env_or("AGENTLINK_LEDGER_URL", "");
    config.db_path = env_or("AGENTLINK_DB_PATH", config.db_path);
    config.log_level = log::parse_level(env_or("AGENTLINK_LOG_LEVEL", "INFO"));
    return config;
}

LedgerPtr make_ledger(const AgentConfig& config) {
    if (!config.network_kind()) {
        log::error("Config", "Invalid network: " + config.network);
        return nullptr;
    }
    if (config.operator_id.empty() || config.operator_key.empty()) {
        log::error("Config", "Operator ID or key not provided");
        return nullptr;
    }
    // memory / sqlite are local only
    if (config.ledger != LedgerKind::Http && *config.network_kind() == Network::Mainnet) {
        log::error("Config", "Local ledger backends are not available on mainnet");
        return nullptr;
    }

    switch (config.ledger) {
        case LedgerKind::Memory:
            return std::make_shared<InMemoryLedger>(config.operator_id, config.first_topic_number);

        case LedgerKind::Sqlite: {
            auto ledger = std::make_shared<SqliteLedger>(config.operator_id, config.first_topic_number);
            if (!ledger->initialize(config.db_path)) return nullptr;
            return ledger;
        }

        case LedgerKind::Http: {
            HttpLedger::Options options;
            options.base_url = config.ledger_url;
            options.operator_id = config.operator_id;
            options.operator_key_hex = config.operator_key;
            options.network = config.network;
            return std::make_shared<HttpLedger>(options);
        }
    }
    return nullptr;
}

} // namespace agentlink
