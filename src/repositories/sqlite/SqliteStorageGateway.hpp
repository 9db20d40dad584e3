#pragma once

#include "repositories/IStorageGateway.hpp"
#include "repositories/TableSchema.hpp"

#include <string>
#include <vector>

struct sqlite3;

namespace msgstore::repositories::sqlite {

// SQLite-backed gateway. Each call is one statement in its own implicit
// transaction. The connection is not shared across threads.
class SqliteStorageGateway : public msgstore::repositories::IStorageGateway {
public:
    /// Opens or creates the database at path (":memory:" for a private
    /// in-memory database) and creates any missing tables.
    SqliteStorageGateway(const std::string& path, const std::vector<TableSchema>& schemas);
    ~SqliteStorageGateway() override;

    SqliteStorageGateway(const SqliteStorageGateway&) = delete;
    SqliteStorageGateway& operator=(const SqliteStorageGateway&) = delete;

    // IStorageGateway
    int64_t insert(const SqlInsertRequest& request) override;
    int update(const SqlUpdateRequest& request) override;
    int remove(const SqlDeleteRequest& request) override;
    QueryResult query(const SqlQueryRequest& request) override;

private:
    void exec(const std::string& sql);

    sqlite3* db_ = nullptr;
};

} // namespace msgstore::repositories::sqlite
