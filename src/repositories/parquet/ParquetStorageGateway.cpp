#include "repositories/parquet/ParquetStorageGateway.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"
#include "repositories/StorageError.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/localfs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>

#include <algorithm>

namespace msgstore::repositories::pq {

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw StorageError(what + " failed: " + status.ToString());
    }
}

} // namespace

ParquetStorageGateway::ParquetStorageGateway(std::shared_ptr<arrow::fs::FileSystem> fs,
                                             const std::vector<TableSchema>& schemas)
    : fs_(std::move(fs)) {
    for (const auto& schema : schemas) {
        schemas_.emplace(schema.name, schema);
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetStorageGateway::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "create " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

const TableSchema& ParquetStorageGateway::schema_for(const std::string& table) const {
    auto it = schemas_.find(table);
    if (it == schemas_.end()) {
        throw StorageError("No such table: " + table);
    }
    return it->second;
}

std::string ParquetStorageGateway::table_path(const std::string& table) {
    return table + ".parquet";
}

int64_t ParquetStorageGateway::insert(const SqlInsertRequest& request) {
    std::lock_guard lock(mutex_);
    auto table = load(schema_for(request.table));
    auto row_id = table.insert(request.columns);
    store(table);
    return row_id;
}

int ParquetStorageGateway::update(const SqlUpdateRequest& request) {
    std::lock_guard lock(mutex_);
    auto table = load(schema_for(request.table));
    int affected = table.update(request.columns, request.where, request.arguments);
    if (affected > 0) store(table);
    return affected;
}

int ParquetStorageGateway::remove(const SqlDeleteRequest& request) {
    std::lock_guard lock(mutex_);
    auto table = load(schema_for(request.table));
    int affected = table.remove(request.where, request.arguments);
    if (affected > 0) store(table);
    return affected;
}

QueryResult ParquetStorageGateway::query(const SqlQueryRequest& request) {
    auto select = parse_select_all(request.sql);
    if (!request.arguments.empty()) {
        throw StorageError("Query takes no arguments: " + request.sql);
    }
    std::lock_guard lock(mutex_);
    return load(schema_for(select.table)).select_all(select.order_by);
}

// --- File I/O ---

RowTable ParquetStorageGateway::load(const TableSchema& schema) const {
    auto path = table_path(schema.name);

    auto info = fs_->GetFileInfo(path);
    check(info.status(), "stat " + path);
    if (info->type() == arrow::fs::FileType::NotFound) {
        return RowTable(schema);
    }

    auto infile = fs_->OpenInputFile(path);
    check(infile.status(), "open " + path);

    std::shared_ptr<arrow::Table> table;
    try {
        auto reader_result = ::parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(*infile));
        check(reader_result.status(), "read " + path);
        auto reader = std::move(reader_result).ValueOrDie();
        check(reader->ReadTable(&table), "read " + path);
    } catch (const ::parquet::ParquetException& e) {
        throw StorageError("read " + path + " failed: " + e.what());
    }

    std::vector<Row> rows(static_cast<size_t>(table->num_rows()), Row(schema.columns.size()));
    for (size_t c = 0; c < schema.columns.size(); ++c) {
        auto column = table->GetColumnByName(schema.columns[c]);
        if (!column) {
            throw StorageError(path + " has no column " + schema.columns[c]);
        }
        if (column->type()->id() != arrow::Type::STRING) {
            throw StorageError(path + " column " + schema.columns[c] + " is not utf8");
        }

        size_t offset = 0;
        for (const auto& chunk : column->chunks()) {
            auto values = std::static_pointer_cast<arrow::StringArray>(chunk);
            for (int64_t i = 0; i < values->length(); ++i) {
                if (!values->IsNull(i)) {
                    rows[offset + static_cast<size_t>(i)][c] = values->GetString(i);
                }
            }
            offset += static_cast<size_t>(values->length());
        }
    }
    return RowTable(schema, std::move(rows));
}

void ParquetStorageGateway::store(const RowTable& table) {
    const auto& schema = table.schema();
    auto path = table_path(schema.name);

    arrow::ArrayVector arrays;
    for (size_t c = 0; c < schema.columns.size(); ++c) {
        arrow::StringBuilder builder;
        for (const auto& row : table.rows()) {
            check(row[c] ? builder.Append(*row[c]) : builder.AppendNull(), "append " + path);
        }
        std::shared_ptr<arrow::Array> array;
        check(builder.Finish(&array), "finish " + path);
        arrays.push_back(std::move(array));
    }

    auto arrow_table = arrow::Table::Make(ParquetSchemas::table_schema(schema), arrays,
                                          static_cast<int64_t>(table.size()));

    auto outfile = fs_->OpenOutputStream(path);
    check(outfile.status(), "open " + path);
    check(::parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), *outfile,
                                       std::max<int64_t>(1, static_cast<int64_t>(table.size()))),
          "write " + path);
    check((*outfile)->Close(), "close " + path);
}

} // namespace msgstore::repositories::pq
