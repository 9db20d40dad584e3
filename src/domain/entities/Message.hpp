#pragma once

#include "domain/value_objects/TextContent.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <string>

namespace msgstore::domain {

class Message {
public:
    Message(std::string id, std::string from_user_id, std::string to_user_id,
            TextContent content, Timestamp created_at);

    const std::string& id() const noexcept { return id_; }
    const std::string& from_user_id() const noexcept { return from_user_id_; }
    const std::string& to_user_id() const noexcept { return to_user_id_; }
    const TextContent& content() const noexcept { return content_; }
    const std::string& text() const noexcept { return content_.text; }
    Direction direction() const noexcept { return content_.direction; }
    Timestamp created_at() const noexcept { return created_at_; }

    // Copy of this message with the content direction classified against the
    // identity of the local user: addressed to them means inbound.
    Message classified_for(const std::string& current_user_id) const;

    bool operator==(const Message&) const = default;

private:
    std::string id_;
    std::string from_user_id_;
    std::string to_user_id_;
    TextContent content_;
    Timestamp created_at_;
};

} // namespace msgstore::domain
