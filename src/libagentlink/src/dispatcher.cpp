#include "agentlink/dispatcher.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

Dispatcher::Dispatcher(TopicManager& topics, std::string local_account_id)
    : topics_(topics), local_account_id_(std::move(local_account_id)) {}

SubmitResult Dispatcher::send_message(const std::string& connection_topic_id,
                                      const std::string& remote_account_id,
                                      const std::string& content) {
    return dispatch(connection_topic_id, remote_account_id,
                    Envelope::make_message(local_account_id_, remote_account_id, content));
}

SubmitResult Dispatcher::request_transaction_approval(const std::string& connection_topic_id,
                                                      const std::string& remote_account_id,
                                                      const std::string& schedule_id,
                                                      const std::string& transaction_data) {
    return dispatch(connection_topic_id, remote_account_id,
                    Envelope::make_transaction(local_account_id_, remote_account_id,
                                               schedule_id, transaction_data));
}

SubmitResult Dispatcher::dispatch(const std::string& connection_topic_id,
                                  const std::string& remote_account_id,
                                  const Envelope& envelope) {
    if (!topics_.client_initialized()) {
        SubmitResult result;
        result.topic_id = connection_topic_id;
        result.status = Status::failure(ErrorCode::ClientNotInitialized, "ledger client not initialized");
        return result;
    }
    if (connection_topic_id.empty() || remote_account_id.empty()) {
        SubmitResult result;
        result.topic_id = connection_topic_id;
        result.status = Status::failure(ErrorCode::InvalidArgument,
                                        "connection topic id and remote account id are required");
        return result;
    }

    log::debug("Dispatcher", std::string("Sending ") + operation_name(envelope.operation) +
               " to " + connection_topic_id + " as " + envelope.operator_id);
    return topics_.submit(connection_topic_id, envelope);
}

} // namespace agentlink
