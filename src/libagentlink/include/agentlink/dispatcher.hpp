#pragma once

#include "agentlink/topic_manager.hpp"
#include <string>

namespace agentlink {

// Builds operation-coded envelopes for a connection topic and submits them
// with the transaction memo their operation requires.
class Dispatcher {
public:
    Dispatcher(TopicManager& topics, std::string local_account_id);

    // op 6, memo hcs-10:op:6:3
    SubmitResult send_message(const std::string& connection_topic_id,
                              const std::string& remote_account_id,
                              const std::string& content);

    // op 7, memo hcs-10:op:7:3
    SubmitResult request_transaction_approval(const std::string& connection_topic_id,
                                              const std::string& remote_account_id,
                                              const std::string& schedule_id,
                                              const std::string& transaction_data);

private:
    SubmitResult dispatch(const std::string& connection_topic_id,
                          const std::string& remote_account_id,
                          const Envelope& envelope);

    TopicManager& topics_;
    std::string local_account_id_;
};

} // namespace agentlink
