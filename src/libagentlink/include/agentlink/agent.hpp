#pragma once

#include "agentlink/config.hpp"
#include "agentlink/directory.hpp"
#include "agentlink/dispatcher.hpp"
#include "agentlink/identity.hpp"
#include "agentlink/negotiator.hpp"
#include "agentlink/topic_manager.hpp"
#include <json/json.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

// Read-only snapshot for monitoring and the CLI.
struct AgentStatus {
    std::string operator_id;
    std::string network;
    std::optional<std::string> inbound_topic_id;
    std::optional<std::string> outbound_topic_id;
    std::optional<std::string> registry_topic_id;
    bool client_initialized = false;
    AgentState state = AgentState::Uninitialized;
    size_t connection_count = 0;

    Json::Value to_json() const;
};

// One protocol participant. Every public operation reports failures through
// its result Status; exceptions never escape.
class Agent {
public:
    Agent(AgentConfig config, LedgerPtr ledger);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Creates the inbound/outbound topics and registers the agent. Once it has
    // succeeded, later calls return the existing topics without touching the ledger.
    InitResult initialize();

    ConnectionResult create_connection_topic(const std::string& remote_account_id,
                                             const std::string& connection_id,
                                             const std::optional<std::string>& remote_public_key = std::nullopt);

    SubmitResult send_message(const std::string& connection_topic_id,
                              const std::string& remote_account_id,
                              const std::string& content);

    SubmitResult request_transaction_approval(const std::string& connection_topic_id,
                                              const std::string& remote_account_id,
                                              const std::string& schedule_id,
                                              const std::string& transaction_data);

    // Direct access to the topic layer with an arbitrary memo / JSON payload.
    TopicResult create_topic(const std::string& memo,
                             const std::optional<KeyPolicy>& admin_key = std::nullopt,
                             const std::optional<KeyPolicy>& submit_key = std::nullopt);
    SubmitResult submit_message(const std::string& topic_id,
                                const Json::Value& message,
                                const std::string& transaction_memo = "");

    AgentStatus status() const;

    // nullptr until initialize() succeeded.
    std::shared_ptr<const AgentIdentity> identity() const;

    std::optional<Connection> find_connection(const std::string& connection_id) const;
    std::vector<Connection> connections() const;

    const AgentConfig& config() const { return config_; }
    TopicManager& topics() { return *topics_; }

private:
    AgentConfig config_;
    LedgerPtr ledger_;
    std::unique_ptr<TopicManager> topics_;
    std::unique_ptr<AgentDirectory> directory_;
    std::unique_ptr<Negotiator> negotiator_;
    std::unique_ptr<Dispatcher> dispatcher_;

    std::mutex init_mutex_;             // serializes initialize()
    mutable std::mutex mutex_;          // guards identity_, state_, connections_
    std::shared_ptr<const AgentIdentity> identity_;
    AgentState state_ = AgentState::Uninitialized;
    std::map<std::string, Connection> connections_;
};

} // namespace agentlink
