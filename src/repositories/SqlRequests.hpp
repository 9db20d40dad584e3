#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace msgstore::repositories {

// Column name to nullable text value, in statement order.
using ColumnValues = std::vector<std::pair<std::string, std::optional<std::string>>>;

struct SqlInsertRequest {
    std::string table;
    ColumnValues columns;
};

struct SqlUpdateRequest {
    std::string table;
    ColumnValues columns;
    std::string where;                   // "column=?" terms joined by AND
    std::vector<std::string> arguments;
};

struct SqlDeleteRequest {
    std::string table;
    std::string where;                   // empty deletes every row
    std::vector<std::string> arguments;
};

struct SqlQueryRequest {
    std::string sql;
    std::vector<std::string> arguments;
};

using WriteRequest = std::variant<SqlInsertRequest, SqlUpdateRequest, SqlDeleteRequest>;

using Row = std::vector<std::optional<std::string>>;

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

inline bool is_sql_identifier(const std::string& name) {
    if (name.empty()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) return false;
    }
    return true;
}

} // namespace msgstore::repositories
