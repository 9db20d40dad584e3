#pragma once

#include "repositories/SqlRequests.hpp"

#include <cstdint>

namespace msgstore::repositories {

// Synchronous access to the persistent store. Every operation either
// completes or throws StorageError; callers run it on the storage worker.
class IStorageGateway {
public:
    // Returns the row id of the new row.
    virtual int64_t insert(const SqlInsertRequest& request) = 0;
    // Return the number of rows affected.
    virtual int update(const SqlUpdateRequest& request) = 0;
    virtual int remove(const SqlDeleteRequest& request) = 0;

    virtual QueryResult query(const SqlQueryRequest& request) = 0;

    virtual ~IStorageGateway() = default;
};

} // namespace msgstore::repositories
