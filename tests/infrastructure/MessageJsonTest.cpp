#include "infrastructure/MessageJson.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;
using namespace msgstore::domain;
using msgstore::infrastructure::MessageJson;

TEST(MessageJson, WritesAllFields) {
    Message m("m1", "alice", "bob", TextContent{"hello", Direction::INBOUND},
              Timestamp(1750428146322));

    auto j = MessageJson::to_json(m);

    EXPECT_EQ(j["id"], "m1");
    EXPECT_EQ(j["from_user_id"], "alice");
    EXPECT_EQ(j["to_user_id"], "bob");
    EXPECT_EQ(j["text"], "hello");
    EXPECT_EQ(j["direction"], "INBOUND");
    EXPECT_EQ(j["created_at"].get<int64_t>(), 1750428146322);
}

TEST(MessageJson, ParsesMessage) {
    auto j = json::parse(R"({
        "id": "m7", "from_user_id": "a", "to_user_id": "b",
        "text": "hi there", "direction": "INBOUND", "created_at": 42
    })");

    auto m = MessageJson::from_json(j);

    EXPECT_EQ(m.id(), "m7");
    EXPECT_EQ(m.from_user_id(), "a");
    EXPECT_EQ(m.to_user_id(), "b");
    EXPECT_EQ(m.text(), "hi there");
    EXPECT_EQ(m.direction(), Direction::INBOUND);
    EXPECT_EQ(m.created_at(), Timestamp(42));
}

TEST(MessageJson, DirectionDefaultsToOutbound) {
    auto j = json::parse(R"({"id": "m1", "from_user_id": "a", "to_user_id": "b",
                             "text": "x", "created_at": 1})");
    EXPECT_EQ(MessageJson::from_json(j).direction(), Direction::OUTBOUND);
}

TEST(MessageJson, ParsesList) {
    auto j = json::parse(R"([
        {"id": "m1", "from_user_id": "a", "to_user_id": "b", "text": "x", "created_at": 2},
        {"id": "m2", "from_user_id": "b", "to_user_id": "a", "text": "y", "created_at": 1}
    ])");

    auto messages = MessageJson::list_from_json(j);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id(), "m1");
    EXPECT_EQ(messages[1].id(), "m2");
}

TEST(MessageJson, SnapshotListIsArray) {
    std::vector<Message> empty;
    EXPECT_EQ(MessageJson::to_json(empty).dump(), "[]");
}

TEST(MessageJson, RejectsMissingField) {
    auto j = json::parse(R"({"id": "m1", "from_user_id": "a", "text": "x", "created_at": 1})");
    EXPECT_THROW(MessageJson::from_json(j), std::invalid_argument);
}

TEST(MessageJson, RejectsWrongTypes) {
    auto j = json::parse(R"({"id": "m1", "from_user_id": "a", "to_user_id": "b",
                             "text": "x", "created_at": "yesterday"})");
    EXPECT_THROW(MessageJson::from_json(j), std::invalid_argument);
}

TEST(MessageJson, RejectsUnknownDirection) {
    auto j = json::parse(R"({"id": "m1", "from_user_id": "a", "to_user_id": "b",
                             "text": "x", "direction": "SIDEWAYS", "created_at": 1})");
    EXPECT_THROW(MessageJson::from_json(j), std::invalid_argument);
}

TEST(MessageJson, RejectsEmptyIdAndNegativeTime) {
    auto no_id = json::parse(R"({"id": "", "from_user_id": "a", "to_user_id": "b",
                                 "text": "x", "created_at": 1})");
    auto negative = json::parse(R"({"id": "m1", "from_user_id": "a", "to_user_id": "b",
                                    "text": "x", "created_at": -5})");
    EXPECT_THROW(MessageJson::from_json(no_id), std::invalid_argument);
    EXPECT_THROW(MessageJson::from_json(negative), std::logic_error);
}

TEST(MessageJson, RejectsNonObjectsAndNonArrays) {
    EXPECT_THROW(MessageJson::from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(MessageJson::list_from_json(json::object()), std::invalid_argument);
}
