#pragma once

#include "agentlink/agent.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace agentlink {

// Runs Agent operations on a fixed pool of worker threads so a slow ledger
// confirmation never blocks the calling thread. Ordering between calls on the
// same topic is left to the ledger's sequence numbers.
class AsyncAgent {
public:
    struct Stats {
        int submitted;
        int completed;
        int pending;
    };

    explicit AsyncAgent(std::shared_ptr<Agent> agent, size_t worker_count = 4);
    ~AsyncAgent();

    AsyncAgent(const AsyncAgent&) = delete;
    AsyncAgent& operator=(const AsyncAgent&) = delete;

    // Finishes queued work, then joins the workers. Work posted afterwards
    // runs on the calling thread.
    void stop();

    std::future<InitResult> initialize();
    std::future<ConnectionResult> create_connection_topic(const std::string& remote_account_id,
                                                          const std::string& connection_id,
                                                          const std::optional<std::string>& remote_public_key = std::nullopt);
    std::future<SubmitResult> send_message(const std::string& connection_topic_id,
                                           const std::string& remote_account_id,
                                           const std::string& content);
    std::future<SubmitResult> request_transaction_approval(const std::string& connection_topic_id,
                                                           const std::string& remote_account_id,
                                                           const std::string& schedule_id,
                                                           const std::string& transaction_data);

    Agent& agent() { return *agent_; }
    Stats get_stats() const;

private:
    template <typename R>
    std::future<R> post(std::function<R()> fn) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        submitted_++;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (running_) {
                queue_.push([this, task] { (*task)(); completed_++; });
                cond_.notify_one();
                return result;
            }
        }
        (*task)();
        completed_++;
        return result;
    }

    void worker_loop();

    std::shared_ptr<Agent> agent_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::queue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    bool running_ = false;

    std::atomic<int> submitted_{0};
    std::atomic<int> completed_{0};
};

} // namespace agentlink
