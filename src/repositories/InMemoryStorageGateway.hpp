#pragma once

#include "repositories/IStorageGateway.hpp"
#include "repositories/RowTable.hpp"
#include "repositories/StorageError.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace msgstore::repositories {

class InMemoryStorageGateway : public msgstore::repositories::IStorageGateway {
public:
    explicit InMemoryStorageGateway(const std::vector<TableSchema>& schemas) {
        for (const auto& schema : schemas) {
            tables_.emplace(schema.name, RowTable(schema));
        }
    }

    int64_t insert(const SqlInsertRequest& request) override {
        std::lock_guard lock(mutex_);
        check_write_failure();
        ++write_count_;
        return table(request.table).insert(request.columns);
    }

    int update(const SqlUpdateRequest& request) override {
        std::lock_guard lock(mutex_);
        check_write_failure();
        ++write_count_;
        return table(request.table).update(request.columns, request.where, request.arguments);
    }

    int remove(const SqlDeleteRequest& request) override {
        std::lock_guard lock(mutex_);
        check_write_failure();
        ++write_count_;
        return table(request.table).remove(request.where, request.arguments);
    }

    QueryResult query(const SqlQueryRequest& request) override {
        std::function<void()> hook;
        {
            std::lock_guard lock(mutex_);
            ++query_count_;
            hook = query_hook_;
        }
        // Outside the lock so the hook may trigger further work.
        if (hook) hook();

        std::lock_guard lock(mutex_);
        if (fail_queries_) {
            throw StorageError("injected query failure");
        }
        auto select = parse_select_all(request.sql);
        if (!request.arguments.empty()) {
            throw StorageError("Query takes no arguments: " + request.sql);
        }
        return table(select.table).select_all(select.order_by);
    }

    // Test helpers
    void fail_next_writes(int count) {
        std::lock_guard lock(mutex_);
        failing_writes_ = count;
    }
    void fail_queries(bool fail) {
        std::lock_guard lock(mutex_);
        fail_queries_ = fail;
    }
    void set_query_hook(std::function<void()> hook) {
        std::lock_guard lock(mutex_);
        query_hook_ = std::move(hook);
    }
    // Raw rows bypass validation, e.g. to plant a malformed record.
    void put_raw_row(const std::string& table_name, Row row) {
        std::lock_guard lock(mutex_);
        auto& t = table(table_name);
        auto rows = t.rows();
        rows.push_back(std::move(row));
        t = RowTable(t.schema(), std::move(rows));
    }
    size_t row_count(const std::string& table_name) {
        std::lock_guard lock(mutex_);
        return table(table_name).size();
    }
    size_t write_count() const {
        std::lock_guard lock(mutex_);
        return write_count_;
    }
    size_t query_count() const {
        std::lock_guard lock(mutex_);
        return query_count_;
    }

private:
    RowTable& table(const std::string& name) {
        auto it = tables_.find(name);
        if (it == tables_.end()) {
            throw StorageError("No such table: " + name);
        }
        return it->second;
    }

    void check_write_failure() {
        if (failing_writes_ > 0) {
            --failing_writes_;
            throw StorageError("injected write failure");
        }
    }

    std::map<std::string, RowTable> tables_;
    mutable std::mutex mutex_;
    std::function<void()> query_hook_;
    int failing_writes_{0};
    bool fail_queries_{false};
    size_t write_count_{0};
    size_t query_count_{0};
};

} // namespace msgstore::repositories
