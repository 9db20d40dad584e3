#pragma once

#include "repositories/IStorageGateway.hpp"
#include "repositories/RowTable.hpp"
#include "repositories/TableSchema.hpp"

#include <arrow/filesystem/api.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace msgstore::repositories::pq {

// Keeps each table in "<table>.parquet" on an Arrow filesystem. Every
// mutation reads the whole file, applies the change and rewrites it.
class ParquetStorageGateway : public msgstore::repositories::IStorageGateway {
public:
    ParquetStorageGateway(std::shared_ptr<arrow::fs::FileSystem> fs,
                          const std::vector<TableSchema>& schemas);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    // IStorageGateway
    int64_t insert(const SqlInsertRequest& request) override;
    int update(const SqlUpdateRequest& request) override;
    int remove(const SqlDeleteRequest& request) override;
    QueryResult query(const SqlQueryRequest& request) override;

private:
    const TableSchema& schema_for(const std::string& table) const;
    static std::string table_path(const std::string& table);

    RowTable load(const TableSchema& schema) const;
    void store(const RowTable& table);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::map<std::string, TableSchema> schemas_;
    mutable std::mutex mutex_;
};

} // namespace msgstore::repositories::pq
