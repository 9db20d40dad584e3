#pragma once

#include "domain/entities/Message.hpp"
#include "repositories/SqlRequests.hpp"
#include "repositories/TableSchema.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace msgstore::repositories {

// A stored row that cannot be turned into a Message.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Schema of the messages table and the mapping between its rows and Message.
class MessagesTable {
public:
    static constexpr const char* kTable = "messages";
    static constexpr const char* kIdColumn = "id";
    static constexpr const char* kContentColumn = "content";
    static constexpr const char* kFromUserIdColumn = "from_user_id";
    static constexpr const char* kToUserIdColumn = "to_user_id";
    static constexpr const char* kCreatedAtColumn = "created_at";

    // Column positions in SELECT * results.
    static constexpr size_t kIdIndex = 0;
    static constexpr size_t kContentIndex = 1;
    static constexpr size_t kFromUserIdIndex = 2;
    static constexpr size_t kToUserIdIndex = 3;
    static constexpr size_t kCreatedAtIndex = 4;
    static constexpr size_t kColumnCount = 5;

    static TableSchema schema();

    // SELECT * FROM messages ORDER BY created_at
    static SqlQueryRequest select_all_ordered();

    // Write requests
    static SqlInsertRequest insert_request(const msgstore::domain::Message& message);
    static SqlUpdateRequest update_request(const msgstore::domain::Message& message);
    static SqlDeleteRequest delete_request(const std::string& message_id);
    static SqlDeleteRequest delete_all_request();

    // Decodes one row of select_all_ordered(). The content direction is
    // derived from current_user_id; it is not stored.
    static msgstore::domain::Message decode(const Row& row, const std::string& current_user_id);
};

} // namespace msgstore::repositories
