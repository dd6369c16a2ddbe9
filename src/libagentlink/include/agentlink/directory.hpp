#pragma once

#include "agentlink/topic_manager.hpp"
#include <optional>
#include <string>

namespace agentlink {

struct RegisterResult {
    Status status;
    bool skipped = false;           // no registry topic configured
    uint64_t sequence_number = 0;
};

// Announces agents on the shared registry topic. Registration is best effort:
// a missing registry is a skip and a failed submission only a warning.
class AgentDirectory {
public:
    AgentDirectory(TopicManager& topics, std::optional<std::string> registry_topic_id);

    const std::optional<std::string>& registry_topic_id() const { return registry_topic_id_; }

    RegisterResult register_agent(const std::string& operator_id,
                                  const std::string& note = "Registering agent.");

private:
    TopicManager& topics_;
    std::optional<std::string> registry_topic_id_;
};

} // namespace agentlink
