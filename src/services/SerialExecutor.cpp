#include "services/SerialExecutor.hpp"

#include <iostream>
#include <stdexcept>

namespace msgstore::services {

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)) {
    worker_ = std::thread(&SerialExecutor::worker_loop, this);
}

SerialExecutor::~SerialExecutor() {
    stop();
}

bool SerialExecutor::execute(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return false;
        queue_.push(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void SerialExecutor::wait_idle() {
    if (is_worker_thread()) {
        throw std::logic_error(name_ + ": wait_idle called from its own worker");
    }
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void SerialExecutor::stop() {
    {
        std::lock_guard lock(mutex_);
        running_ = false;
    }
    work_cv_.notify_all();

    if (worker_.joinable() && !is_worker_thread()) {
        worker_.join();
    }
}

bool SerialExecutor::is_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::worker_loop() {
    while (true) {
        Task task;

        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty()) {
                // Stopped and drained
                busy_ = false;
                idle_cv_.notify_all();
                return;
            }

            task = std::move(queue_.front());
            queue_.pop();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Task failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[" << name_ << "] Task failed: unknown exception" << std::endl;
        }

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
    }
}

} // namespace msgstore::services
