#include "agentlink/negotiator.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

namespace {
    constexpr uint32_t CONNECTION_SUBMIT_THRESHOLD = 2;
}

const char* agent_state_name(AgentState state) {
    switch (state) {
        case AgentState::Uninitialized: return "uninitialized";
        case AgentState::InboundReady:  return "inbound_ready";
        case AgentState::OutboundReady: return "outbound_ready";
        case AgentState::Registered:    return "registered";
        case AgentState::Ready:         return "ready";
        default:                        return "unknown";
    }
}

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Requested: return "requested";
        case ConnectionState::Created:   return "created";
        default:                         return "unknown";
    }
}

Negotiator::Negotiator(TopicManager& topics, AgentDirectory& directory, uint32_t ttl_seconds)
    : topics_(topics), directory_(directory), ttl_seconds_(ttl_seconds) {}

InitResult Negotiator::initialize_agent_topics(const std::string& operator_id, Network network) {
    InitResult result;

    if (!topics_.client_initialized()) {
        result.status = Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
        return result;
    }
    if (operator_id.empty()) {
        result.status = Status::failure(ErrorCode::InvalidArgument, "operator id is empty");
        return result;
    }

    KeyPair admin_key = KeyPair::generate();
    KeyPair submit_key = KeyPair::generate();

    // Public topic: anyone may post connection requests.
    TopicResult inbound = topics_.create_topic(TopicMemo::inbound(ttl_seconds_, operator_id),
                                               KeyPolicy::single(admin_key), std::nullopt);
    if (!inbound.status.ok()) {
        result.status = inbound.status;
        return result;
    }
    result.inbound_topic_id = inbound.topic_id;
    result.state = AgentState::InboundReady;
    log::info("Negotiator", "Inbound topic ready: " + inbound.topic_id);

    // Only this agent may post to its outbound activity log.
    TopicResult outbound = topics_.create_topic(TopicMemo::outbound(ttl_seconds_),
                                                KeyPolicy::single(admin_key),
                                                KeyPolicy::single(submit_key));
    if (!outbound.status.ok()) {
        log::error("Negotiator", "Outbound topic creation failed, inbound topic " +
                   inbound.topic_id + " is left in place");
        result.status = outbound.status;
        return result;
    }
    result.outbound_topic_id = outbound.topic_id;
    result.state = AgentState::OutboundReady;
    log::info("Negotiator", "Outbound topic ready: " + outbound.topic_id);

    result.registration = directory_.register_agent(operator_id);
    if (!result.registration.skipped && result.registration.status.ok()) {
        result.state = AgentState::Registered;
    }

    auto identity = std::make_shared<AgentIdentity>();
    identity->operator_id = operator_id;
    identity->network = network;
    identity->inbound_topic_id = result.inbound_topic_id;
    identity->outbound_topic_id = result.outbound_topic_id;
    identity->registry_topic_id = directory_.registry_topic_id();
    result.identity = identity;
    result.state = AgentState::Ready;
    return result;
}

ConnectionResult Negotiator::create_connection_topic(const AgentIdentity& identity,
                                                     const std::string& remote_account_id,
                                                     const std::string& connection_id,
                                                     const std::optional<std::string>& remote_public_key) {
    ConnectionResult result;
    result.connection.connection_id = connection_id;
    result.connection.local_account_id = identity.operator_id;
    result.connection.remote_account_id = remote_account_id;
    result.connection.state = ConnectionState::Requested;

    if (!topics_.client_initialized()) {
        result.status = Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
        return result;
    }
    if (identity.inbound_topic_id.empty() || identity.outbound_topic_id.empty()) {
        result.status = Status::failure(ErrorCode::NotReady, "agent topics not initialized");
        return result;
    }
    if (remote_account_id.empty() || connection_id.empty()) {
        result.status = Status::failure(ErrorCode::InvalidArgument,
                                        "remote account id and connection id are required");
        return result;
    }

    KeyPair admin_key = KeyPair::generate();
    KeyPair local_key = KeyPair::generate();

    std::vector<std::string> submit_keys = {local_key.public_key_hex()};
    if (remote_public_key && !remote_public_key->empty()) {
        submit_keys.push_back(*remote_public_key);
    }
    KeyPolicy submit_policy = KeyPolicy::threshold_of(CONNECTION_SUBMIT_THRESHOLD, submit_keys);
    if (!submit_policy.satisfiable()) {
        log::warn("Negotiator", "Connection " + connection_id + " submit key is " +
                  submit_policy.describe() + ", counterparty key not supplied");
    }

    TopicResult topic = topics_.create_topic(
        TopicMemo::connection(ttl_seconds_, identity.inbound_topic_id, connection_id),
        KeyPolicy::single(admin_key), submit_policy);
    if (!topic.status.ok()) {
        result.status = topic.status;
        return result;
    }

    result.connection.connection_topic_id = topic.topic_id;
    result.connection.state = ConnectionState::Created;
    log::info("Negotiator", "Connection " + connection_id + " with " + remote_account_id +
              " on topic " + topic.topic_id);

    SubmitResult notice = topics_.submit(
        identity.inbound_topic_id,
        Envelope::make_connection_created(topic.topic_id, identity.operator_id,
                                          remote_account_id, connection_id));
    result.connection.notified = notice.status.ok();
    if (!notice.status.ok()) {
        log::warn("Negotiator", "connection_created record for " + connection_id +
                  " not submitted: " + notice.status.to_string());
    }
    return result;
}

} // namespace agentlink
