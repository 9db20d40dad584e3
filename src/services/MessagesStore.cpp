#include "services/MessagesStore.hpp"

#include "repositories/InMemoryStorageGateway.hpp"
#include "repositories/MessagesTable.hpp"
#include "repositories/sqlite/SqliteStorageGateway.hpp"

#ifdef MSGSTORE_HAS_PARQUET
#include "repositories/parquet/ParquetStorageGateway.hpp"
#endif

#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace msgstore::domain;
using namespace msgstore::repositories;

namespace msgstore::services {

MessagesStore::MessagesStore(std::unique_ptr<IStorageGateway> gateway,
                             const msgstore::config::SessionSettings& session)
    : gateway_(std::move(gateway))
    , executor_("storage")
    , sequencer_(*gateway_, executor_)
    , repository_(*gateway_, executor_, session.current_user_id) {
    sequencer_.set_on_changed([this] { repository_.notify_changed(); });
}

MessagesStore::~MessagesStore() {
    stop();
}

std::unique_ptr<MessagesStore> MessagesStore::open(const msgstore::config::Settings& settings) {
    const auto& storage = settings.storage;
    std::vector<TableSchema> schemas{MessagesTable::schema()};
    std::unique_ptr<IStorageGateway> gateway;

    if (storage.backend == "sqlite") {
        std::filesystem::path path(storage.database_path);
        if (storage.database_path != ":memory:" && path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        gateway = std::make_unique<sqlite::SqliteStorageGateway>(storage.database_path, schemas);
    } else if (storage.backend == "parquet") {
#ifdef MSGSTORE_HAS_PARQUET
        gateway = std::make_unique<pq::ParquetStorageGateway>(
            pq::ParquetStorageGateway::make_local_fs(storage.data_directory), schemas);
#else
        throw std::runtime_error("Parquet backend requested but not compiled in. "
                                 "Rebuild with Apache Arrow installed.");
#endif
    } else if (storage.backend == "memory") {
        gateway = std::make_unique<InMemoryStorageGateway>(schemas);
    } else {
        throw std::runtime_error("Unknown storage backend: " + storage.backend);
    }

    if (settings.log.verbose) {
        std::cout << "[store] Opened " << storage.backend << " storage" << std::endl;
    }
    return std::make_unique<MessagesStore>(std::move(gateway), settings.session);
}

bool MessagesStore::insert(const std::optional<Message>& message) {
    if (!message) {
        std::cerr << "[store] Insert rejected: message is absent" << std::endl;
        return false;
    }
    sequencer_.enqueue(MessagesTable::insert_request(*message));
    return true;
}

void MessagesStore::update(const Message& message) {
    sequencer_.enqueue(MessagesTable::update_request(message));
}

bool MessagesStore::remove(const Message& message) {
    sequencer_.enqueue(MessagesTable::delete_request(message.id()));
    return true;
}

void MessagesStore::clear() {
    sequencer_.enqueue(MessagesTable::delete_all_request());
}

void MessagesStore::wait_idle() {
    executor_.wait_idle();
}

void MessagesStore::stop() {
    executor_.stop();
}

StoreStats MessagesStore::stats() const {
    StoreStats s;
    s.applied = sequencer_.applied_count();
    s.failed = sequencer_.failure_count();
    s.pending = sequencer_.pending();
    s.reloads = repository_.reload_count();
    s.reload_failures = repository_.reload_failure_count();
    return s;
}

} // namespace msgstore::services
