#pragma once

#include <stdexcept>
#include <string>

namespace msgstore::domain {

enum class Direction { INBOUND, OUTBOUND };

inline Direction direction_from_string(const std::string& str) {
    if (str == "INBOUND") return Direction::INBOUND;
    if (str == "OUTBOUND") return Direction::OUTBOUND;
    throw std::invalid_argument("Invalid direction: " + str);
}

inline std::string to_string(Direction direction) {
    return direction == Direction::INBOUND ? "INBOUND" : "OUTBOUND";
}

} // namespace msgstore::domain
