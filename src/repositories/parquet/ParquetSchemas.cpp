#include "repositories/parquet/ParquetSchemas.hpp"

namespace msgstore::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::table_schema(const TableSchema& table) {
    arrow::FieldVector fields;
    for (const auto& column : table.columns) {
        fields.push_back(arrow::field(column, arrow::utf8(), /*nullable=*/true));
    }
    return arrow::schema(fields);
}

} // namespace msgstore::repositories::pq
