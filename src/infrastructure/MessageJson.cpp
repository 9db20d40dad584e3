#include "infrastructure/MessageJson.hpp"

#include <stdexcept>

using json = nlohmann::json;
using namespace msgstore::domain;

namespace msgstore::infrastructure {

json MessageJson::to_json(const Message& message) {
    return json{
        {"id", message.id()},
        {"from_user_id", message.from_user_id()},
        {"to_user_id", message.to_user_id()},
        {"text", message.text()},
        {"direction", msgstore::domain::to_string(message.direction())},
        {"created_at", message.created_at().milliseconds()},
    };
}

json MessageJson::to_json(const std::vector<Message>& messages) {
    json arr = json::array();
    for (const auto& message : messages) {
        arr.push_back(to_json(message));
    }
    return arr;
}

Message MessageJson::from_json(const json& obj) {
    if (!obj.is_object()) {
        throw std::invalid_argument("Message JSON must be an object");
    }
    try {
        auto direction = obj.contains("direction")
            ? direction_from_string(obj["direction"].get<std::string>())
            : Direction::OUTBOUND;
        return Message(
            obj.at("id").get<std::string>(),
            obj.at("from_user_id").get<std::string>(),
            obj.at("to_user_id").get<std::string>(),
            TextContent{obj.at("text").get<std::string>(), direction},
            Timestamp(obj.at("created_at").get<int64_t>()));
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid message JSON: ") + e.what());
    }
}

std::vector<Message> MessageJson::list_from_json(const json& arr) {
    if (!arr.is_array()) {
        throw std::invalid_argument("Message list JSON must be an array");
    }
    std::vector<Message> messages;
    for (const auto& obj : arr) {
        messages.push_back(from_json(obj));
    }
    return messages;
}

} // namespace msgstore::infrastructure
