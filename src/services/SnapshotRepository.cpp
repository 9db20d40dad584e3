#include "services/SnapshotRepository.hpp"

#include <iostream>

using namespace msgstore::domain;
using namespace msgstore::repositories;

namespace msgstore::services {

SnapshotRepository::SnapshotRepository(IStorageGateway& gateway,
                                       IExecutor& executor,
                                       std::string current_user_id,
                                       SqlQueryRequest query)
    : gateway_(gateway)
    , executor_(executor)
    , current_user_id_(std::move(current_user_id))
    , query_(std::move(query))
    , snapshot_(std::make_shared<const std::vector<Message>>()) {
}

SnapshotRepository::Snapshot SnapshotRepository::current_snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

SnapshotRepository::ObserverId SnapshotRepository::add_observer(Observer observer) {
    std::lock_guard lock(mutex_);
    auto id = next_observer_id_++;
    observers_.emplace(id, std::move(observer));

    if (observers_.size() == 1) {
        // Activation: start from a fresh read, never a leftover reload.
        ++generation_;
        rerun_requested_ = false;
        schedule_reload_locked();
    }
    return id;
}

void SnapshotRepository::remove_observer(ObserverId id) {
    std::lock_guard lock(mutex_);
    if (observers_.erase(id) == 0) return;

    if (observers_.empty()) {
        ++generation_;
        state_ = ReloadState::IDLE;
        rerun_requested_ = false;
    }
}

size_t SnapshotRepository::observer_count() const {
    std::lock_guard lock(mutex_);
    return observers_.size();
}

void SnapshotRepository::notify_changed() {
    std::lock_guard lock(mutex_);
    if (observers_.empty()) return;

    switch (state_) {
        case ReloadState::IDLE:
            schedule_reload_locked();
            break;
        case ReloadState::QUEUED:
            // The queued reload has not read yet and will see this change.
            break;
        case ReloadState::FETCHING:
            rerun_requested_ = true;
            break;
    }
}

SnapshotRepository::ReloadState SnapshotRepository::reload_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void SnapshotRepository::schedule_reload_locked() {
    auto generation = generation_;
    if (!executor_.execute([this, generation] { run_reload(generation); })) {
        std::cerr << "[snapshot] Executor stopped, reload skipped" << std::endl;
        state_ = ReloadState::IDLE;
        return;
    }
    state_ = ReloadState::QUEUED;
}

bool SnapshotRepository::is_current(uint64_t generation) const {
    std::lock_guard lock(mutex_);
    return generation == generation_;
}

void SnapshotRepository::run_reload(uint64_t generation) {
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) return;
        state_ = ReloadState::FETCHING;
    }

    Snapshot fresh;
    try {
        auto result = gateway_.query(query_);
        auto messages = std::make_shared<std::vector<Message>>();
        messages->reserve(result.rows.size());
        for (const auto& row : result.rows) {
            if (!is_current(generation)) return;  // cancelled
            messages->push_back(MessagesTable::decode(row, current_user_id_));
        }
        fresh = std::move(messages);
    } catch (const std::exception& e) {
        ++reload_failure_count_;
        std::cerr << "[snapshot] Reload failed, keeping previous snapshot: "
                  << e.what() << std::endl;
        finish_reload(generation);
        return;
    }

    std::vector<Observer> observers;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) return;
        snapshot_ = fresh;
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    ++reload_count_;

    for (const auto& observer : observers) {
        try {
            observer(fresh);
        } catch (const std::exception& e) {
            std::cerr << "[snapshot] Observer threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[snapshot] Observer threw an unknown exception" << std::endl;
        }
    }

    finish_reload(generation);
}

void SnapshotRepository::finish_reload(uint64_t generation) {
    std::lock_guard lock(mutex_);
    if (generation != generation_) return;

    if (rerun_requested_) {
        rerun_requested_ = false;
        schedule_reload_locked();
    } else {
        state_ = ReloadState::IDLE;
    }
}

} // namespace msgstore::services
