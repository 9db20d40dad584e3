#pragma once

#include "config/Settings.hpp"
#include "domain/entities/Message.hpp"
#include "repositories/IStorageGateway.hpp"
#include "services/SerialExecutor.hpp"
#include "services/SnapshotRepository.hpp"
#include "services/WriteSequencer.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace msgstore::services {

struct StoreStats {
    uint64_t applied = 0;
    uint64_t failed = 0;
    size_t pending = 0;
    uint64_t reloads = 0;
    uint64_t reload_failures = 0;
};

// The message store held by the application: fire-and-forget writes funnel
// through one WriteSequencer, observers read the SnapshotRepository. One
// instance per process, created at startup and stopped at shutdown.
class MessagesStore {
public:
    MessagesStore(std::unique_ptr<msgstore::repositories::IStorageGateway> gateway,
                  const msgstore::config::SessionSettings& session);
    ~MessagesStore();

    MessagesStore(const MessagesStore&) = delete;
    MessagesStore& operator=(const MessagesStore&) = delete;

    /// Builds the storage gateway named by settings.storage.backend.
    /// Throws std::runtime_error for an unknown or unavailable backend.
    static std::unique_ptr<MessagesStore> open(const msgstore::config::Settings& settings);

    SnapshotRepository& messages() { return repository_; }

    // Returns false, and enqueues nothing, when message is absent.
    bool insert(const std::optional<msgstore::domain::Message>& message);
    void update(const msgstore::domain::Message& message);
    // Always reports success; the outcome is only visible in later snapshots.
    bool remove(const msgstore::domain::Message& message);
    void clear();

    // Blocks until every queued write and reload has run. Not callable from
    // an observer: throws std::logic_error on the storage worker.
    void wait_idle();
    void stop();

    StoreStats stats() const;

private:
    std::unique_ptr<msgstore::repositories::IStorageGateway> gateway_;
    SerialExecutor executor_;
    WriteSequencer sequencer_;
    SnapshotRepository repository_;
};

} // namespace msgstore::services
