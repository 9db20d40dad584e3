#include "repositories/sqlite/SqliteStorageGateway.hpp"
#include "repositories/StorageError.hpp"

#include <sqlite3.h>

#include <sstream>

namespace msgstore::repositories::sqlite {

namespace {

struct Statement {
    sqlite3_stmt* handle = nullptr;
    ~Statement() { if (handle) sqlite3_finalize(handle); }
};

void check(int rc, sqlite3* db, const std::string& what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::ostringstream oss;
        oss << what << " failed: " << sqlite3_errmsg(db) << " (rc=" << rc << ")";
        throw StorageError(oss.str());
    }
}

void require_identifier(const std::string& name) {
    if (!is_sql_identifier(name)) {
        throw StorageError("Invalid SQL identifier: '" + name + "'");
    }
}

void prepare(sqlite3* db, const std::string& sql, Statement& stmt) {
    check(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.handle, nullptr), db, "prepare " + sql);
}

void bind(sqlite3* db, Statement& stmt, int index, const std::optional<std::string>& value) {
    int rc = value
        ? sqlite3_bind_text(stmt.handle, index, value->c_str(),
                            static_cast<int>(value->size()), SQLITE_TRANSIENT)
        : sqlite3_bind_null(stmt.handle, index);
    check(rc, db, "bind parameter " + std::to_string(index));
}

void run_to_completion(sqlite3* db, Statement& stmt, const std::string& what) {
    int rc = sqlite3_step(stmt.handle);
    if (rc != SQLITE_DONE) {
        check(rc == SQLITE_ROW ? SQLITE_MISUSE : rc, db, what);
    }
}

std::string assignment_list(const ColumnValues& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        require_identifier(columns[i].first);
        if (i > 0) out += ", ";
        out += columns[i].first + " = ?";
    }
    return out;
}

} // namespace

SqliteStorageGateway::SqliteStorageGateway(const std::string& path,
                                           const std::vector<TableSchema>& schemas) {
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open database '" + path + "': " + message);
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        for (const auto& schema : schemas) {
            require_identifier(schema.name);
            for (const auto& column : schema.columns) {
                require_identifier(column);
            }
            exec(schema.create_sql());
        }
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStorageGateway::~SqliteStorageGateway() {
    if (db_) sqlite3_close(db_);
}

void SqliteStorageGateway::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("sqlite exec failed: " + message);
    }
}

int64_t SqliteStorageGateway::insert(const SqlInsertRequest& request) {
    require_identifier(request.table);
    if (request.columns.empty()) {
        throw StorageError("Insert into " + request.table + " has no columns");
    }

    std::string names, placeholders;
    for (size_t i = 0; i < request.columns.size(); ++i) {
        require_identifier(request.columns[i].first);
        if (i > 0) {
            names += ", ";
            placeholders += ", ";
        }
        names += request.columns[i].first;
        placeholders += "?";
    }

    Statement stmt;
    prepare(db_, "INSERT INTO " + request.table + " (" + names + ") VALUES (" + placeholders + ")",
            stmt);
    for (size_t i = 0; i < request.columns.size(); ++i) {
        bind(db_, stmt, static_cast<int>(i) + 1, request.columns[i].second);
    }
    run_to_completion(db_, stmt, "insert into " + request.table);
    return sqlite3_last_insert_rowid(db_);
}

int SqliteStorageGateway::update(const SqlUpdateRequest& request) {
    require_identifier(request.table);
    if (request.columns.empty()) {
        throw StorageError("Update of " + request.table + " has no columns");
    }

    std::string sql = "UPDATE " + request.table + " SET " + assignment_list(request.columns);
    if (!request.where.empty()) {
        sql += " WHERE " + request.where;
    }

    Statement stmt;
    prepare(db_, sql, stmt);
    int index = 1;
    for (const auto& [column, value] : request.columns) {
        bind(db_, stmt, index++, value);
    }
    for (const auto& argument : request.arguments) {
        bind(db_, stmt, index++, argument);
    }
    run_to_completion(db_, stmt, "update " + request.table);
    return sqlite3_changes(db_);
}

int SqliteStorageGateway::remove(const SqlDeleteRequest& request) {
    require_identifier(request.table);

    std::string sql = "DELETE FROM " + request.table;
    if (!request.where.empty()) {
        sql += " WHERE " + request.where;
    }

    Statement stmt;
    prepare(db_, sql, stmt);
    int index = 1;
    for (const auto& argument : request.arguments) {
        bind(db_, stmt, index++, argument);
    }
    run_to_completion(db_, stmt, "delete from " + request.table);
    return sqlite3_changes(db_);
}

QueryResult SqliteStorageGateway::query(const SqlQueryRequest& request) {
    Statement stmt;
    prepare(db_, request.sql, stmt);
    int index = 1;
    for (const auto& argument : request.arguments) {
        bind(db_, stmt, index++, argument);
    }

    QueryResult result;
    int column_count = sqlite3_column_count(stmt.handle);
    for (int i = 0; i < column_count; ++i) {
        const char* name = sqlite3_column_name(stmt.handle, i);
        result.columns.emplace_back(name ? name : "");
    }

    int rc;
    while ((rc = sqlite3_step(stmt.handle)) == SQLITE_ROW) {
        Row row;
        row.reserve(column_count);
        for (int i = 0; i < column_count; ++i) {
            if (sqlite3_column_type(stmt.handle, i) == SQLITE_NULL) {
                row.emplace_back(std::nullopt);
                continue;
            }
            auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle, i));
            int size = sqlite3_column_bytes(stmt.handle, i);
            row.emplace_back(text ? std::string(text, static_cast<size_t>(size)) : std::string());
        }
        result.rows.push_back(std::move(row));
    }
    check(rc, db_, "query " + request.sql);
    return result;
}

} // namespace msgstore::repositories::sqlite
