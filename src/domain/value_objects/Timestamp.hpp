#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace msgstore::domain {

class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    static Timestamp from_string(const std::string& str);

    int64_t milliseconds() const noexcept { return ms_; }

    // Zero-padded to 19 digits so that text comparison matches numeric order.
    std::string to_sortable_string() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace msgstore::domain
