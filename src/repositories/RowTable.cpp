#include "repositories/RowTable.hpp"
#include "repositories/StorageError.hpp"

#include <algorithm>
#include <regex>

namespace msgstore::repositories {

namespace {

std::string trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

// Split on the AND keyword, case-insensitive.
std::vector<std::string> split_conjunction(const std::string& where) {
    static const std::regex and_keyword(R"(\s+AND\s+)", std::regex::icase);
    std::vector<std::string> terms;
    std::sregex_token_iterator it(where.begin(), where.end(), and_keyword, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        terms.push_back(trim(*it));
    }
    return terms;
}

} // namespace

SelectAll parse_select_all(const std::string& sql) {
    static const std::regex pattern(
        R"(^\s*SELECT\s+\*\s+FROM\s+(\w+)(?:\s+ORDER\s+BY\s+(\w+))?\s*;?\s*$)",
        std::regex::icase);
    std::smatch match;
    if (!std::regex_match(sql, match, pattern)) {
        throw StorageError("Unsupported query: " + sql);
    }
    SelectAll select{match[1].str(), std::nullopt};
    if (match[2].matched) {
        select.order_by = match[2].str();
    }
    return select;
}

RowTable::RowTable(TableSchema schema) : RowTable(std::move(schema), {}) {}

RowTable::RowTable(TableSchema schema, std::vector<Row> rows)
    : schema_(std::move(schema))
    , key_index_(0)
    , rows_(std::move(rows))
    , next_row_id_(static_cast<int64_t>(rows_.size()) + 1) {
    key_index_ = column_index(schema_.primary_key);
    for (const auto& row : rows_) {
        if (row.size() != schema_.columns.size()) {
            throw StorageError("Row width does not match table " + schema_.name);
        }
    }
}

size_t RowTable::column_index(const std::string& column) const {
    auto it = std::find(schema_.columns.begin(), schema_.columns.end(), column);
    if (it == schema_.columns.end()) {
        throw StorageError("No such column: " + schema_.name + "." + column);
    }
    return static_cast<size_t>(it - schema_.columns.begin());
}

RowTable::Predicate RowTable::bind_where(const std::string& where,
                                         const std::vector<std::string>& arguments) const {
    static const std::regex term_pattern(R"(^(\w+)\s*=\s*\?$)");

    Predicate predicate;
    if (trim(where).empty()) {
        if (!arguments.empty()) {
            throw StorageError("Arguments given without a where clause");
        }
        return predicate;
    }

    auto terms = split_conjunction(where);
    if (terms.size() != arguments.size()) {
        throw StorageError("Where clause expects " + std::to_string(terms.size())
            + " arguments, got " + std::to_string(arguments.size()));
    }
    for (size_t i = 0; i < terms.size(); ++i) {
        std::smatch match;
        if (!std::regex_match(terms[i], match, term_pattern)) {
            throw StorageError("Unsupported where term: " + terms[i]);
        }
        predicate.emplace_back(column_index(match[1].str()), arguments[i]);
    }
    return predicate;
}

bool RowTable::matches(const Row& row, const Predicate& predicate) {
    for (const auto& [index, value] : predicate) {
        if (!row[index].has_value() || *row[index] != value) return false;
    }
    return true;
}

bool RowTable::has_key(const std::string& key) const {
    for (const auto& row : rows_) {
        if (row[key_index_].has_value() && *row[key_index_] == key) return true;
    }
    return false;
}

int64_t RowTable::insert(const ColumnValues& values) {
    Row row(schema_.columns.size());
    for (const auto& [column, value] : values) {
        row[column_index(column)] = value;
    }

    const auto& key = row[key_index_];
    if (!key.has_value()) {
        throw StorageError("NULL primary key for table " + schema_.name);
    }
    if (has_key(*key)) {
        throw StorageError("UNIQUE constraint failed: " + schema_.name + "."
            + schema_.primary_key + " = " + *key);
    }

    rows_.push_back(std::move(row));
    return next_row_id_++;
}

int RowTable::update(const ColumnValues& values, const std::string& where,
                     const std::vector<std::string>& arguments) {
    auto predicate = bind_where(where, arguments);

    std::vector<std::pair<size_t, std::optional<std::string>>> assignments;
    for (const auto& [column, value] : values) {
        assignments.emplace_back(column_index(column), value);
    }

    // Stage the result so a key collision leaves the table untouched.
    auto updated = rows_;
    int affected = 0;
    for (auto& row : updated) {
        if (!matches(row, predicate)) continue;
        for (const auto& [index, value] : assignments) {
            row[index] = value;
        }
        ++affected;
    }

    for (size_t i = 0; i < updated.size(); ++i) {
        const auto& key = updated[i][key_index_];
        if (!key.has_value()) {
            throw StorageError("NULL primary key for table " + schema_.name);
        }
        for (size_t j = i + 1; j < updated.size(); ++j) {
            if (updated[j][key_index_] == key) {
                throw StorageError("UNIQUE constraint failed: " + schema_.name + "."
                    + schema_.primary_key + " = " + *key);
            }
        }
    }

    rows_ = std::move(updated);
    return affected;
}

int RowTable::remove(const std::string& where, const std::vector<std::string>& arguments) {
    auto predicate = bind_where(where, arguments);
    auto before = rows_.size();
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                               [&](const Row& row) { return matches(row, predicate); }),
                rows_.end());
    return static_cast<int>(before - rows_.size());
}

QueryResult RowTable::select_all(const std::optional<std::string>& order_by) const {
    QueryResult result{schema_.columns, rows_};
    if (order_by) {
        auto index = column_index(*order_by);
        // NULLs sort first, ties keep insertion order.
        std::stable_sort(result.rows.begin(), result.rows.end(),
                         [index](const Row& a, const Row& b) { return a[index] < b[index]; });
    }
    return result;
}

} // namespace msgstore::repositories
