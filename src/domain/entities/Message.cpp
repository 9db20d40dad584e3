#include "domain/entities/Message.hpp"

#include <stdexcept>
#include <utility>

namespace msgstore::domain {

Message::Message(std::string id, std::string from_user_id, std::string to_user_id,
                 TextContent content, Timestamp created_at)
    : id_(std::move(id))
    , from_user_id_(std::move(from_user_id))
    , to_user_id_(std::move(to_user_id))
    , content_(std::move(content))
    , created_at_(created_at) {
    if (id_.empty()) {
        throw std::invalid_argument("Message id must not be empty");
    }
}

Message Message::classified_for(const std::string& current_user_id) const {
    auto direction = (to_user_id_ == current_user_id) ? Direction::INBOUND : Direction::OUTBOUND;
    return Message(id_, from_user_id_, to_user_id_, TextContent{content_.text, direction},
                   created_at_);
}

} // namespace msgstore::domain
