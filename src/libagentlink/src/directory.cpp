#include "agentlink/directory.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

AgentDirectory::AgentDirectory(TopicManager& topics, std::optional<std::string> registry_topic_id)
    : topics_(topics), registry_topic_id_(std::move(registry_topic_id)) {
    if (registry_topic_id_ && registry_topic_id_->empty())
        registry_topic_id_.reset();
}

RegisterResult AgentDirectory::register_agent(const std::string& operator_id, const std::string& note) {
    RegisterResult result;
    if (!registry_topic_id_) {
        log::debug("AgentDirectory", "No registry topic configured, skipping registration");
        result.skipped = true;
        return result;
    }

    SubmitResult submitted = topics_.submit(*registry_topic_id_, Envelope::make_register(operator_id, note));
    result.status = submitted.status;
    result.sequence_number = submitted.sequence_number;

    if (!submitted.status.ok()) {
        log::warn("AgentDirectory", "Failed to register in registry " + *registry_topic_id_ +
                  ": " + submitted.status.to_string());
    } else {
        log::info("AgentDirectory", "Registered " + operator_id + " in registry " + *registry_topic_id_);
    }
    return result;
}

} // namespace agentlink
