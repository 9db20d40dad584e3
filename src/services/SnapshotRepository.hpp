#pragma once

#include "domain/entities/Message.hpp"
#include "repositories/IStorageGateway.hpp"
#include "repositories/MessagesTable.hpp"
#include "services/IExecutor.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace msgstore::services {

// Single-slot cache of the whole messages table, ordered by creation time.
//
// Reloads run on the storage executor and only while at least one observer
// is attached. Change notifications arriving while a reload is queued are
// absorbed by it; those arriving while a reload is running schedule exactly
// one more. A failed reload keeps the previous snapshot.
//
// The executor must be drained or stopped before this object is destroyed.
class SnapshotRepository {
public:
    using Snapshot = std::shared_ptr<const std::vector<msgstore::domain::Message>>;
    using Observer = std::function<void(const Snapshot&)>;
    using ObserverId = uint64_t;

    enum class ReloadState { IDLE, QUEUED, FETCHING };

    SnapshotRepository(msgstore::repositories::IStorageGateway& gateway,
                       IExecutor& executor,
                       std::string current_user_id,
                       msgstore::repositories::SqlQueryRequest query =
                           msgstore::repositories::MessagesTable::select_all_ordered());

    // Never null; starts as the empty list.
    Snapshot current_snapshot() const;

    // Observers are called on the storage executor after each successful
    // reload. The first observer triggers an immediate reload.
    ObserverId add_observer(Observer observer);
    // Removing the last observer cancels any pending or running reload.
    void remove_observer(ObserverId id);
    size_t observer_count() const;
    bool is_active() const { return observer_count() > 0; }

    // Signal that the underlying table changed.
    void notify_changed();

    ReloadState reload_state() const;
    uint64_t reload_count() const { return reload_count_.load(); }
    uint64_t reload_failure_count() const { return reload_failure_count_.load(); }

private:
    void schedule_reload_locked();
    void run_reload(uint64_t generation);
    void finish_reload(uint64_t generation);
    bool is_current(uint64_t generation) const;

    msgstore::repositories::IStorageGateway& gateway_;
    IExecutor& executor_;
    const std::string current_user_id_;
    const msgstore::repositories::SqlQueryRequest query_;

    mutable std::mutex mutex_;
    Snapshot snapshot_;
    std::map<ObserverId, Observer> observers_;
    ObserverId next_observer_id_{1};
    ReloadState state_{ReloadState::IDLE};
    bool rerun_requested_{false};
    // Bumped on activation and deactivation; reloads of an older generation
    // are cancelled.
    uint64_t generation_{0};

    std::atomic<uint64_t> reload_count_{0};
    std::atomic<uint64_t> reload_failure_count_{0};
};

} // namespace msgstore::services
