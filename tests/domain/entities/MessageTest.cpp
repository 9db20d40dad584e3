#include "domain/entities/Message.hpp"

#include <gtest/gtest.h>

using namespace msgstore::domain;

TEST(Message, ConstructsWithAllFields) {
    Message m("m1", "u1", "u2", TextContent{"hi", Direction::OUTBOUND}, Timestamp(100));
    EXPECT_EQ(m.id(), "m1");
    EXPECT_EQ(m.from_user_id(), "u1");
    EXPECT_EQ(m.to_user_id(), "u2");
    EXPECT_EQ(m.text(), "hi");
    EXPECT_EQ(m.direction(), Direction::OUTBOUND);
    EXPECT_EQ(m.created_at(), Timestamp(100));
}

TEST(Message, ThrowsOnEmptyId) {
    EXPECT_THROW(Message("", "u1", "u2", TextContent{"hi"}, Timestamp(100)),
                 std::invalid_argument);
}

TEST(Message, AllowsEmptyText) {
    Message m("m1", "u1", "u2", TextContent{""}, Timestamp(100));
    EXPECT_TRUE(m.text().empty());
}

TEST(Message, AddressedToCurrentUserIsInbound) {
    Message m("m1", "u2", "u1", TextContent{"yo"}, Timestamp(200));
    EXPECT_EQ(m.classified_for("u1").direction(), Direction::INBOUND);
}

TEST(Message, AddressedToSomeoneElseIsOutbound) {
    Message m("m1", "u1", "u2", TextContent{"hi", Direction::INBOUND}, Timestamp(100));
    EXPECT_EQ(m.classified_for("u1").direction(), Direction::OUTBOUND);
}

TEST(Message, ClassificationKeepsOtherFields) {
    Message m("m1", "u2", "u1", TextContent{"yo"}, Timestamp(200));
    auto classified = m.classified_for("u1");
    EXPECT_EQ(classified.id(), "m1");
    EXPECT_EQ(classified.text(), "yo");
    EXPECT_EQ(classified.created_at(), Timestamp(200));
}

TEST(Message, EqualityComparesAllFields) {
    Message a("m1", "u1", "u2", TextContent{"hi"}, Timestamp(100));
    Message b("m1", "u1", "u2", TextContent{"hi"}, Timestamp(100));
    Message c("m1", "u1", "u2", TextContent{"hello"}, Timestamp(100));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
