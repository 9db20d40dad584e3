#pragma once

#include "domain/entities/Message.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace msgstore::infrastructure {

class MessageJson {
public:
    // {"id", "from_user_id", "to_user_id", "text", "direction", "created_at"}
    static nlohmann::json to_json(const msgstore::domain::Message& message);
    static nlohmann::json to_json(const std::vector<msgstore::domain::Message>& messages);

    // Reads the fields written by to_json. "direction" is optional and
    // defaults to OUTBOUND. Throws std::invalid_argument on missing or
    // mistyped fields.
    static msgstore::domain::Message from_json(const nlohmann::json& obj);
    static std::vector<msgstore::domain::Message> list_from_json(const nlohmann::json& arr);
};

} // namespace msgstore::infrastructure
