#pragma once

#include "repositories/IStorageGateway.hpp"
#include "services/IExecutor.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace msgstore::services {

// Applies write requests one at a time, in enqueue order, on the storage
// executor. Callers are never told the outcome; every successful write
// raises the changed callback, every failed one is logged and dropped.
class WriteSequencer {
public:
    using ChangedCallback = std::function<void()>;

    WriteSequencer(msgstore::repositories::IStorageGateway& gateway, IExecutor& executor);

    void set_on_changed(ChangedCallback callback);

    // Non-blocking; safe from any thread.
    void enqueue(msgstore::repositories::WriteRequest request);

    size_t pending() const;
    uint64_t applied_count() const { return applied_count_.load(); }
    uint64_t failure_count() const { return failure_count_.load(); }

private:
    void apply_next();
    void apply(const msgstore::repositories::WriteRequest& request);

    msgstore::repositories::IStorageGateway& gateway_;
    IExecutor& executor_;

    mutable std::mutex queue_mutex_;
    std::deque<msgstore::repositories::WriteRequest> queue_;

    std::mutex callback_mutex_;
    ChangedCallback on_changed_;

    std::atomic<uint64_t> applied_count_{0};
    std::atomic<uint64_t> failure_count_{0};
};

} // namespace msgstore::services
