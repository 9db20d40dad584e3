#pragma once

#include <string>
#include <vector>

namespace msgstore::repositories {

// A table whose columns are all nullable TEXT, keyed by one of them.
struct TableSchema {
    std::string name;
    std::vector<std::string> columns;
    std::string primary_key;

    std::string create_sql() const {
        std::string sql = "CREATE TABLE IF NOT EXISTS " + name + " (";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += columns[i] + " TEXT";
            if (columns[i] == primary_key) sql += " PRIMARY KEY";
        }
        sql += ")";
        return sql;
    }
};

} // namespace msgstore::repositories
