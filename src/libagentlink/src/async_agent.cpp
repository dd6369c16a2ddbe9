#include "agentlink/async_agent.hpp"
#include "agentlink/log.hpp"

namespace agentlink {

AsyncAgent::AsyncAgent(std::shared_ptr<Agent> agent, size_t worker_count)
    : agent_(std::move(agent)) {
    if (worker_count == 0) worker_count = 1;
    running_ = true;
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    log::debug("AsyncAgent", "Started " + std::to_string(worker_count) + " workers");
}

AsyncAgent::~AsyncAgent() {
    stop();
}

void AsyncAgent::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cond_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    log::debug("AsyncAgent", "Stopped");
}

void AsyncAgent::worker_loop() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (true) {
        cond_.wait(lk, [this] { return !queue_.empty() || !running_; });
        if (queue_.empty()) break;   // stopped and drained

        auto job = std::move(queue_.front());
        queue_.pop();
        lk.unlock();
        job();
        lk.lock();
    }
}

std::future<InitResult> AsyncAgent::initialize() {
    auto agent = agent_;
    return post<InitResult>([agent] { return agent->initialize(); });
}

std::future<ConnectionResult> AsyncAgent::create_connection_topic(const std::string& remote_account_id,
                                                                  const std::string& connection_id,
                                                                  const std::optional<std::string>& remote_public_key) {
    auto agent = agent_;
    return post<ConnectionResult>([agent, remote_account_id, connection_id, remote_public_key] {
        return agent->create_connection_topic(remote_account_id, connection_id, remote_public_key);
    });
}

std::future<SubmitResult> AsyncAgent::send_message(const std::string& connection_topic_id,
                                                   const std::string& remote_account_id,
                                                   const std::string& content) {
    auto agent = agent_;
    return post<SubmitResult>([agent, connection_topic_id, remote_account_id, content] {
        return agent->send_message(connection_topic_id, remote_account_id, content);
    });
}

std::future<SubmitResult> AsyncAgent::request_transaction_approval(const std::string& connection_topic_id,
                                                                   const std::string& remote_account_id,
                                                                   const std::string& schedule_id,
                                                                   const std::string& transaction_data) {
    auto agent = agent_;
    return post<SubmitResult>([agent, connection_topic_id, remote_account_id, schedule_id, transaction_data] {
        return agent->request_transaction_approval(connection_topic_id, remote_account_id,
                                                   schedule_id, transaction_data);
    });
}

AsyncAgent::Stats AsyncAgent::get_stats() const {
    Stats stats;
    stats.submitted = submitted_.load();
    stats.completed = completed_.load();
    std::lock_guard<std::mutex> lk(mutex_);
    stats.pending = static_cast<int>(queue_.size());
    return stats;
}

} // namespace agentlink
