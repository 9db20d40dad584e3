#include "domain/value_objects/Timestamp.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace msgstore::domain {

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::from_string(const std::string& str) {
    if (str.empty() || str.front() < '0' || str.front() > '9') {
        throw std::invalid_argument("Timestamp must be a decimal number: '" + str + "'");
    }
    size_t consumed = 0;
    int64_t value = std::stoll(str, &consumed);
    if (consumed != str.size()) {
        throw std::invalid_argument("Timestamp has trailing characters: " + str);
    }
    return Timestamp(value);
}

std::string Timestamp::to_sortable_string() const {
    std::ostringstream out;
    out << std::setw(19) << std::setfill('0') << ms_;
    return out.str();
}

} // namespace msgstore::domain
