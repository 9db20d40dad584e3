#pragma once

#include <stdexcept>

namespace msgstore::repositories {

// Raised by storage gateways when a statement cannot be applied.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace msgstore::repositories
