#pragma once

#include "services/IExecutor.hpp"

#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace msgstore::services {

// One background thread running tasks in submission order. All storage
// access of a store goes through a single instance, so statements never
// overlap.
class SerialExecutor : public IExecutor {
public:
    explicit SerialExecutor(std::string name = "storage");
    ~SerialExecutor() override;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    bool execute(Task task) override;

    /// Blocks until the queue is empty and no task is running.
    /// Throws std::logic_error when called from a task.
    void wait_idle();

    /// Runs the tasks already queued, then joins the worker. Idempotent.
    void stop();

    bool is_worker_thread() const;

private:
    void worker_loop();

    std::string name_;
    std::queue<Task> queue_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    bool running_{true};
    bool busy_{false};
    std::thread worker_;
};

} // namespace msgstore::services
