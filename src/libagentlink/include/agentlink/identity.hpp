#pragma once

#include "agentlink/config.hpp"
#include <optional>
#include <string>

namespace agentlink {

enum class AgentState {
    Uninitialized,
    InboundReady,
    OutboundReady,
    Registered,
    Ready
};

const char* agent_state_name(AgentState state);

// Produced once by topic initialization and never modified afterwards.
struct AgentIdentity {
    std::string operator_id;
    Network network = Network::Testnet;
    std::string inbound_topic_id;
    std::string outbound_topic_id;
    std::optional<std::string> registry_topic_id;
};

enum class ConnectionState {
    Requested,
    Created
};

const char* connection_state_name(ConnectionState state);

struct Connection {
    std::string connection_id;
    std::string connection_topic_id;
    std::string local_account_id;
    std::string remote_account_id;
    ConnectionState state = ConnectionState::Requested;
    bool notified = false;      // connection_created record accepted on the inbound topic
};

} // namespace agentlink
