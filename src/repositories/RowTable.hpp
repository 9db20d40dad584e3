#pragma once

#include "repositories/SqlRequests.hpp"
#include "repositories/TableSchema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace msgstore::repositories {

// The one query shape served by the non-SQL backends:
// SELECT * FROM <table> [ORDER BY <column>]
struct SelectAll {
    std::string table;
    std::optional<std::string> order_by;
};

// Throws StorageError for any other statement.
SelectAll parse_select_all(const std::string& sql);

// Rows of one table held in memory, in insertion order. Applies the same
// request forms the SQL backend accepts.
class RowTable {
public:
    explicit RowTable(TableSchema schema);
    RowTable(TableSchema schema, std::vector<Row> rows);

    int64_t insert(const ColumnValues& values);
    int update(const ColumnValues& values, const std::string& where,
               const std::vector<std::string>& arguments);
    int remove(const std::string& where, const std::vector<std::string>& arguments);
    QueryResult select_all(const std::optional<std::string>& order_by) const;

    const TableSchema& schema() const noexcept { return schema_; }
    const std::vector<Row>& rows() const noexcept { return rows_; }
    size_t size() const noexcept { return rows_.size(); }

private:
    using Predicate = std::vector<std::pair<size_t, std::string>>;

    size_t column_index(const std::string& column) const;
    Predicate bind_where(const std::string& where, const std::vector<std::string>& arguments) const;
    static bool matches(const Row& row, const Predicate& predicate);
    bool has_key(const std::string& key) const;

    TableSchema schema_;
    size_t key_index_;
    std::vector<Row> rows_;
    int64_t next_row_id_;
};

} // namespace msgstore::repositories
