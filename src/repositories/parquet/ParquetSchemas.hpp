#pragma once

#include "repositories/TableSchema.hpp"

#include <arrow/api.h>

namespace msgstore::repositories::pq {

class ParquetSchemas {
public:
    // Arrow schema for a table file: one nullable utf8 field per column.
    static std::shared_ptr<arrow::Schema> table_schema(const TableSchema& table);
};

} // namespace msgstore::repositories::pq
