#include "agentlink/agent.hpp"
#include "agentlink/config.hpp"
#include "agentlink/json_util.hpp"
#include "agentlink/log.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace agentlink;

namespace {

void usage() {
    std::cerr <<
        "usage: agentlink_cli <command> [args]\n"
        "\n"
        "commands:\n"
        "  status                                   print the agent status snapshot\n"
        "  init                                     create inbound/outbound topics and register\n"
        "  session <remote> <connection_id> [msg..] init, open a connection, send each message\n"
        "  approve <remote> <connection_id> <schedule_id> <data>\n"
        "                                           init, open a connection, request approval\n"
        "\n"
        "configuration is read from HEDERA_NETWORK, HEDERA_OPERATOR_ID, HEDERA_OPERATOR_KEY,\n"
        "HCS_REGISTRY_TOPIC_ID, HCS_TOPIC_TTL, AGENTLINK_LEDGER (http|memory|sqlite),\n"
        "AGENTLINK_LEDGER_URL, AGENTLINK_DB_PATH and AGENTLINK_LOG_LEVEL.\n";
}

int report(const Status& status) {
    if (status.ok()) return 0;
    std::cerr << "error: " << status.to_string() << std::endl;
    return 1;
}

void print_json(const Json::Value& value) {
    std::cout << write_json(value) << std::endl;
}

Json::Value submit_json(const SubmitResult& r) {
    Json::Value out(Json::objectValue);
    out["success"] = r.status.ok();
    out["topic_id"] = r.topic_id;
    if (r.status.ok()) {
        out["sequence_number"] = static_cast<Json::UInt64>(r.sequence_number);
        out["transaction_id"] = r.transaction_id;
    } else {
        out["error"] = r.status.to_string();
    }
    return out;
}

// Initializes the agent and opens one connection. Returns the connection topic
// id, or an empty string after reporting the failure.
std::string open_connection(Agent& agent, const std::string& remote, const std::string& connection_id) {
    InitResult init = agent.initialize();
    if (report(init.status) != 0) return "";

    ConnectionResult conn = agent.create_connection_topic(remote, connection_id);
    if (report(conn.status) != 0) return "";

    Json::Value out(Json::objectValue);
    out["success"] = true;
    out["connection_topic_id"] = conn.connection.connection_topic_id;
    out["connected_account_id"] = conn.connection.remote_account_id;
    out["connection_id"] = conn.connection.connection_id;
    out["notified"] = conn.connection.notified;
    print_json(out);
    return conn.connection.connection_topic_id;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        usage();
        return args.empty() ? 2 : 0;
    }

    try {
        AgentConfig config = AgentConfig::from_env();
        agentlink::log::set_level(config.log_level);

        auto agent = std::make_shared<Agent>(config, make_ledger(config));
        const std::string& command = args[0];

        if (command == "status") {
            print_json(agent->status().to_json());
            return 0;
        }

        if (command == "init") {
            InitResult init = agent->initialize();
            if (report(init.status) != 0) return 1;
            Json::Value out(Json::objectValue);
            out["success"] = true;
            out["inbound_topic_id"] = init.inbound_topic_id;
            out["outbound_topic_id"] = init.outbound_topic_id;
            out["registered"] = !init.registration.skipped && init.registration.status.ok();
            print_json(out);
            return 0;
        }

        if (command == "session" && args.size() >= 3) {
            std::string topic = open_connection(*agent, args[1], args[2]);
            if (topic.empty()) return 1;
            int rc = 0;
            for (size_t i = 3; i < args.size(); ++i) {
                SubmitResult sent = agent->send_message(topic, args[1], args[i]);
                print_json(submit_json(sent));
                if (!sent.status.ok()) rc = 1;
            }
            return rc;
        }

        if (command == "approve" && args.size() == 5) {
            std::string topic = open_connection(*agent, args[1], args[2]);
            if (topic.empty()) return 1;
            SubmitResult sent = agent->request_transaction_approval(topic, args[1], args[3], args[4]);
            print_json(submit_json(sent));
            return sent.status.ok() ? 0 : 1;
        }

        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}
