#include "agentlink/agent.hpp"
#include "agentlink/json_util.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

namespace {
    Status not_initialized() {
        return Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
    }

    Status internal_error(const char* what, const std::exception& e) {
        log::error("Agent", std::string("Error ") + what + ": " + e.what());
        return Status::failure(ErrorCode::Internal, e.what());
    }
}

Json::Value AgentStatus::to_json() const {
    Json::Value out(Json::objectValue);
    out["operator_id"] = operator_id;
    out["network"] = network;
    out["inbound_topic_id"] = inbound_topic_id ? Json::Value(*inbound_topic_id) : Json::Value();
    out["outbound_topic_id"] = outbound_topic_id ? Json::Value(*outbound_topic_id) : Json::Value();
    out["registry_topic_id"] = registry_topic_id ? Json::Value(*registry_topic_id) : Json::Value();
    out["client_initialized"] = client_initialized;
    out["state"] = agent_state_name(state);
    out["connection_count"] = static_cast<Json::UInt64>(connection_count);
    return out;
}

Agent::Agent(AgentConfig config, LedgerPtr ledger)
    : config_(std::move(config))
    , ledger_(std::move(ledger)) {
    topics_ = std::make_unique<TopicManager>(ledger_);
    directory_ = std::make_unique<AgentDirectory>(*topics_, config_.registry_topic_id);
    negotiator_ = std::make_unique<Negotiator>(*topics_, *directory_, config_.ttl_seconds);
    dispatcher_ = std::make_unique<Dispatcher>(*topics_, config_.operator_id);

    if (topics_->client_initialized()) {
        log::info("Agent", "Ledger client initialized for " + config_.network);
    } else {
        log::error("Agent", "Ledger client not initialized, operations will fail");
    }
}

Agent::~Agent() = default;

InitResult Agent::initialize() {
    std::lock_guard<std::mutex> init_lk(init_mutex_);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (identity_) {
            InitResult done;
            done.state = state_;
            done.identity = identity_;
            done.inbound_topic_id = identity_->inbound_topic_id;
            done.outbound_topic_id = identity_->outbound_topic_id;
            done.registration.skipped = true;
            return done;
        }
    }

    InitResult result;
    if (!topics_->client_initialized()) {
        result.status = not_initialized();
        return result;
    }

    auto network = config_.network_kind();
    if (!network) {
        result.status = Status::failure(ErrorCode::InvalidArgument, "invalid network: " + config_.network);
        return result;
    }

    try {
        result = negotiator_->initialize_agent_topics(config_.operator_id, *network);
    } catch (const std::exception& e) {
        result.status = internal_error("initializing agent topics", e);
        return result;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    state_ = result.state;
    if (result.status.ok()) {
        identity_ = result.identity;
        log::info("Agent", "Agent " + config_.operator_id + " ready: inbound " +
                  result.inbound_topic_id + ", outbound " + result.outbound_topic_id);
    } else {
        // Partial progress is not kept as identity; a retry starts over.
        state_ = AgentState::Uninitialized;
    }
    return result;
}

ConnectionResult Agent::create_connection_topic(const std::string& remote_account_id,
                                                const std::string& connection_id,
                                                const std::optional<std::string>& remote_public_key) {
    ConnectionResult result;
    result.connection.connection_id = connection_id;
    result.connection.local_account_id = config_.operator_id;
    result.connection.remote_account_id = remote_account_id;

    if (!topics_->client_initialized()) {
        result.status = not_initialized();
        return result;
    }

    std::shared_ptr<const AgentIdentity> identity;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        identity = identity_;
        if (!identity) {
            result.status = Status::failure(ErrorCode::NotReady, "agent topics not initialized");
            return result;
        }
        if (connections_.count(connection_id)) {
            result.status = Status::failure(ErrorCode::InvalidArgument,
                                            "connection id already in use: " + connection_id);
            return result;
        }
        connections_[connection_id] = result.connection;
    }

    try {
        result = negotiator_->create_connection_topic(*identity, remote_account_id,
                                                      connection_id, remote_public_key);
    } catch (const std::exception& e) {
        result.status = internal_error("creating connection topic", e);
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (result.status.ok()) {
        connections_[connection_id] = result.connection;
    } else {
        connections_.erase(connection_id);
    }
    return result;
}

SubmitResult Agent::send_message(const std::string& connection_topic_id,
                                 const std::string& remote_account_id,
                                 const std::string& content) {
    try {
        return dispatcher_->send_message(connection_topic_id, remote_account_id, content);
    } catch (const std::exception& e) {
        SubmitResult result;
        result.topic_id = connection_topic_id;
        result.status = internal_error("sending message", e);
        return result;
    }
}

SubmitResult Agent::request_transaction_approval(const std::string& connection_topic_id,
                                                 const std::string& remote_account_id,
                                                 const std::string& schedule_id,
                                                 const std::string& transaction_data) {
    try {
        return dispatcher_->request_transaction_approval(connection_topic_id, remote_account_id,
                                                         schedule_id, transaction_data);
    } catch (const std::exception& e) {
        SubmitResult result;
        result.topic_id = connection_topic_id;
        result.status = internal_error("requesting transaction approval", e);
        return result;
    }
}

TopicResult Agent::create_topic(const std::string& memo,
                                const std::optional<KeyPolicy>& admin_key,
                                const std::optional<KeyPolicy>& submit_key) {
    try {
        return topics_->create_topic(memo, admin_key, submit_key);
    } catch (const std::exception& e) {
        TopicResult result;
        result.memo = memo;
        result.status = internal_error("creating topic", e);
        return result;
    }
}

SubmitResult Agent::submit_message(const std::string& topic_id,
                                   const Json::Value& message,
                                   const std::string& transaction_memo) {
    try {
        std::string text = write_json(message);
        return topics_->submit_message(topic_id, std::vector<uint8_t>(text.begin(), text.end()),
                                       transaction_memo);
    } catch (const std::exception& e) {
        SubmitResult result;
        result.topic_id = topic_id;
        result.status = internal_error("submitting message", e);
        return result;
    }
}

AgentStatus Agent::status() const {
    AgentStatus s;
    s.operator_id = config_.operator_id;
    s.network = config_.network;
    s.registry_topic_id = directory_->registry_topic_id();
    s.client_initialized = topics_->client_initialized();

    std::lock_guard<std::mutex> lk(mutex_);
    if (identity_) {
        s.inbound_topic_id = identity_->inbound_topic_id;
        s.outbound_topic_id = identity_->outbound_topic_id;
    }
    s.state = state_;
    s.connection_count = connections_.size();
    return s;
}

std::shared_ptr<const AgentIdentity> Agent::identity() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return identity_;
}

std::optional<Connection> Agent::find_connection(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return std::nullopt;
    return it->second;
}

std::vector<Connection> Agent::connections() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Connection> out;
    out.reserve(connections_.size());
    for (const auto& kv : connections_) out.push_back(kv.second);
    return out;
}

} // namespace agentlink
