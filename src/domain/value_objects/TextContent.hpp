#pragma once

#include "domain/value_objects/Direction.hpp"

#include <string>

namespace msgstore::domain {

struct TextContent {
    std::string text;
    Direction direction = Direction::OUTBOUND;

    bool operator==(const TextContent&) const = default;
};

} // namespace msgstore::domain
