#include "services/WriteSequencer.hpp"

#include <iostream>
#include <type_traits>
#include <variant>

using namespace msgstore::repositories;

namespace msgstore::services {

namespace {

const std::string& table_of(const WriteRequest& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.table; }, request);
}

} // namespace

WriteSequencer::WriteSequencer(IStorageGateway& gateway, IExecutor& executor)
    : gateway_(gateway)
    , executor_(executor) {
}

void WriteSequencer::set_on_changed(ChangedCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_changed_ = std::move(callback);
}

void WriteSequencer::enqueue(WriteRequest request) {
    // Held across execute() so queue order and drain steps stay paired.
    std::lock_guard lock(queue_mutex_);
    if (!executor_.execute([this] { apply_next(); })) {
        std::cerr << "[sequencer] Executor stopped, dropping write to "
                  << table_of(request) << std::endl;
        return;
    }
    queue_.push_back(std::move(request));
}

size_t WriteSequencer::pending() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

void WriteSequencer::apply_next() {
    WriteRequest request;
    {
        std::lock_guard lock(queue_mutex_);
        if (queue_.empty()) return;
        request = std::move(queue_.front());
        queue_.pop_front();
    }
    apply(request);
}

void WriteSequencer::apply(const WriteRequest& request) {
    try {
        std::visit([this](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SqlInsertRequest>) {
                gateway_.insert(r);
            } else if constexpr (std::is_same_v<T, SqlUpdateRequest>) {
                gateway_.update(r);
            } else if constexpr (std::is_same_v<T, SqlDeleteRequest>) {
                gateway_.remove(r);
            }
        }, request);
    } catch (const std::exception& e) {
        ++failure_count_;
        std::cerr << "[sequencer] Write to " << table_of(request) << " failed: "
                  << e.what() << std::endl;
        return;
    }

    ++applied_count_;

    ChangedCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = on_changed_;
    }
    if (callback) callback();
}

} // namespace msgstore::services
