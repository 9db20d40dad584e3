#include "repositories/MessagesTable.hpp"

using namespace msgstore::domain;

namespace msgstore::repositories {

namespace {

constexpr const char* kModifyWhere = "id=?";

const std::string& required(const Row& row, size_t index, const char* column) {
    if (!row[index].has_value()) {
        throw DecodeError(std::string("NULL value in column ") + column);
    }
    return *row[index];
}

ColumnValues message_columns(const Message& message) {
    return {
        {MessagesTable::kIdColumn, message.id()},
        {MessagesTable::kContentColumn, message.text()},
        {MessagesTable::kFromUserIdColumn, message.from_user_id()},
        {MessagesTable::kToUserIdColumn, message.to_user_id()},
        {MessagesTable::kCreatedAtColumn, message.created_at().to_sortable_string()},
    };
}

} // namespace

TableSchema MessagesTable::schema() {
    return TableSchema{
        kTable,
        {kIdColumn, kContentColumn, kFromUserIdColumn, kToUserIdColumn, kCreatedAtColumn},
        kIdColumn
    };
}

SqlQueryRequest MessagesTable::select_all_ordered() {
    return SqlQueryRequest{
        std::string("SELECT * FROM ") + kTable + " ORDER BY " + kCreatedAtColumn, {}
    };
}

SqlInsertRequest MessagesTable::insert_request(const Message& message) {
    return SqlInsertRequest{kTable, message_columns(message)};
}

SqlUpdateRequest MessagesTable::update_request(const Message& message) {
    auto columns = message_columns(message);
    columns.erase(columns.begin());  // id is the key, not an assignment
    return SqlUpdateRequest{kTable, std::move(columns), kModifyWhere, {message.id()}};
}

SqlDeleteRequest MessagesTable::delete_request(const std::string& message_id) {
    return SqlDeleteRequest{kTable, kModifyWhere, {message_id}};
}

SqlDeleteRequest MessagesTable::delete_all_request() {
    return SqlDeleteRequest{kTable, "", {}};
}

Message MessagesTable::decode(const Row& row, const std::string& current_user_id) {
    if (row.size() < kColumnCount) {
        throw DecodeError("Expected " + std::to_string(kColumnCount) + " columns, got "
            + std::to_string(row.size()));
    }

    const auto& created_at_text = required(row, kCreatedAtIndex, kCreatedAtColumn);
    try {
        Message message(required(row, kIdIndex, kIdColumn),
                        required(row, kFromUserIdIndex, kFromUserIdColumn),
                        required(row, kToUserIdIndex, kToUserIdColumn),
                        TextContent{required(row, kContentIndex, kContentColumn)},
                        Timestamp::from_string(created_at_text));
        return message.classified_for(current_user_id);
    } catch (const std::logic_error& e) {
        // invalid_argument / out_of_range from the domain constructors and stoll
        throw DecodeError("Malformed message row: " + std::string(e.what()));
    }
}

} // namespace msgstore::repositories
