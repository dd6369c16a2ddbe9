#pragma once

#include "agentlink/directory.hpp"
#include "agentlink/identity.hpp"
#include "agentlink/topic_manager.hpp"
#include <memory>
#include <optional>
#include <string>

namespace agentlink {

struct InitResult {
    Status status;
    AgentState state = AgentState::Uninitialized;   // furthest state reached
    std::string inbound_topic_id;
    std::string outbound_topic_id;
    RegisterResult registration;
    std::shared_ptr<const AgentIdentity> identity;  // set only on success
};

struct ConnectionResult {
    Status status;
    Connection connection;
};

// Drives agent topic initialization and the connection handshake.
class Negotiator {
public:
    Negotiator(TopicManager& topics, AgentDirectory& directory, uint32_t ttl_seconds);

    // Creates the inbound topic, then the outbound topic, then announces the
    // agent in the registry. Outbound is never attempted when inbound failed,
    // and an inbound topic left behind by a failed outbound creation is kept.
    // Registry failures do not fail initialization.
    InitResult initialize_agent_topics(const std::string& operator_id, Network network);

    // Creates a dual-control connection topic referencing the caller's own
    // inbound topic and records connection_created on that inbound topic.
    // The connection counts as Created once the topic exists, whether or not
    // the record could be submitted.
    //
    // remote_public_key, when the counterparty's key was exchanged out of
    // band, is enumerated in the 2-of-N submit key next to the local key.
    ConnectionResult create_connection_topic(const AgentIdentity& identity,
                                             const std::string& remote_account_id,
                                             const std::string& connection_id,
                                             const std::optional<std::string>& remote_public_key = std::nullopt);

    uint32_t ttl_seconds() const { return ttl_seconds_; }

private:
    TopicManager& topics_;
    AgentDirectory& directory_;
    uint32_t ttl_seconds_;
};

} // namespace agentlink
