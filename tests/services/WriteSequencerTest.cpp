#include "services/WriteSequencer.hpp"

#include "ManualExecutor.hpp"
#include "repositories/InMemoryStorageGateway.hpp"
#include "repositories/MessagesTable.hpp"
#include "services/SerialExecutor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace msgstore::domain;
using namespace msgstore::repositories;
using namespace msgstore::services;

class WriteSequencerTest : public ::testing::Test {
protected:
    InMemoryStorageGateway gateway{std::vector<TableSchema>{MessagesTable::schema()}};
    ManualExecutor executor;
    WriteSequencer sequencer{gateway, executor};
    int changes = 0;

    void SetUp() override {
        sequencer.set_on_changed([this] { ++changes; });
    }

    Message make_message(const std::string& id, int64_t t = 100) {
        return Message(id, "u1", "u2", TextContent{"text " + id}, Timestamp(t));
    }

    std::vector<std::string> stored_ids() {
        std::vector<std::string> ids;
        for (const auto& row : gateway.query(MessagesTable::select_all_ordered()).rows) {
            ids.push_back(*row[MessagesTable::kIdIndex]);
        }
        return ids;
    }
};

TEST_F(WriteSequencerTest, EnqueueDoesNotTouchStorage) {
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1")));

    EXPECT_EQ(sequencer.pending(), 1u);
    EXPECT_EQ(executor.queued(), 1u);
    EXPECT_EQ(gateway.write_count(), 0u);
    EXPECT_EQ(changes, 0);
}

TEST_F(WriteSequencerTest, AppliesWritesAndSignalsEachChange) {
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1", 100)));
    sequencer.enqueue(MessagesTable::insert_request(make_message("m2", 200)));

    executor.run_all();

    EXPECT_EQ(stored_ids(), (std::vector<std::string>{"m1", "m2"}));
    EXPECT_EQ(sequencer.applied_count(), 2u);
    EXPECT_EQ(sequencer.pending(), 0u);
    EXPECT_EQ(changes, 2);
}

TEST_F(WriteSequencerTest, InsertThenDeleteLeavesNothing) {
    sequencer.enqueue(MessagesTable::insert_request(make_message("a")));
    sequencer.enqueue(MessagesTable::delete_request("a"));

    executor.run_all();

    EXPECT_TRUE(stored_ids().empty());
}

TEST_F(WriteSequencerTest, DeleteThenInsertLeavesRow) {
    sequencer.enqueue(MessagesTable::delete_request("a"));
    sequencer.enqueue(MessagesTable::insert_request(make_message("a")));

    executor.run_all();

    EXPECT_EQ(stored_ids(), std::vector<std::string>{"a"});
    // Deleting nothing still counts as a completed write.
    EXPECT_EQ(changes, 2);
}

TEST_F(WriteSequencerTest, FailedWriteIsCountedAndSkipped) {
    gateway.fail_next_writes(1);
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1", 100)));
    sequencer.enqueue(MessagesTable::insert_request(make_message("m2", 200)));

    executor.run_all();

    EXPECT_EQ(stored_ids(), std::vector<std::string>{"m2"});
    EXPECT_EQ(sequencer.failure_count(), 1u);
    EXPECT_EQ(sequencer.applied_count(), 1u);
    EXPECT_EQ(changes, 1);
}

TEST_F(WriteSequencerTest, DuplicateInsertFails) {
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1", 100)));
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1", 200)));

    executor.run_all();

    EXPECT_EQ(stored_ids(), std::vector<std::string>{"m1"});
    EXPECT_EQ(sequencer.failure_count(), 1u);
}

TEST_F(WriteSequencerTest, UpdateAndClear) {
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1", 100)));
    sequencer.enqueue(MessagesTable::insert_request(make_message("m2", 200)));
    Message edited("m1", "u1", "u2", TextContent{"edited"}, Timestamp(100));
    sequencer.enqueue(MessagesTable::update_request(edited));
    executor.run_all();

    auto rows = gateway.query(MessagesTable::select_all_ordered()).rows;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][MessagesTable::kContentIndex], "edited");

    sequencer.enqueue(MessagesTable::delete_all_request());
    executor.run_all();
    EXPECT_TRUE(stored_ids().empty());
}

TEST_F(WriteSequencerTest, StoppedExecutorDropsWrite) {
    executor.stop();
    sequencer.enqueue(MessagesTable::insert_request(make_message("m1")));

    EXPECT_EQ(sequencer.pending(), 0u);
    EXPECT_EQ(executor.queued(), 0u);
}

TEST(WriteSequencerOrdering, ConcurrentProducersApplyEveryWrite) {
    InMemoryStorageGateway gateway{std::vector<TableSchema>{MessagesTable::schema()}};
    SerialExecutor executor;
    WriteSequencer sequencer(gateway, executor);
    std::atomic<int> changes{0};
    sequencer.set_on_changed([&] { ++changes; });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&sequencer, p] {
            for (int i = 0; i < 50; ++i) {
                auto id = "p" + std::to_string(p) + "-" + std::to_string(i);
                sequencer.enqueue(MessagesTable::insert_request(
                    Message(id, "u1", "u2", TextContent{id}, Timestamp(p * 1000 + i))));
            }
        });
    }
    for (auto& t : producers) t.join();
    executor.wait_idle();

    EXPECT_EQ(gateway.row_count("messages"), 200u);
    EXPECT_EQ(sequencer.applied_count(), 200u);
    EXPECT_EQ(changes, 200);
}

TEST(WriteSequencerOrdering, PerProducerOrderIsKept) {
    InMemoryStorageGateway gateway{std::vector<TableSchema>{MessagesTable::schema()}};
    SerialExecutor executor;
    WriteSequencer sequencer(gateway, executor);

    // Insert, delete, insert again: only correct in enqueue order.
    auto message = Message("m1", "u1", "u2", TextContent{"v2"}, Timestamp(1));
    for (int i = 0; i < 20; ++i) {
        sequencer.enqueue(MessagesTable::insert_request(message));
        sequencer.enqueue(MessagesTable::delete_request("m1"));
    }
    sequencer.enqueue(MessagesTable::insert_request(message));
    executor.wait_idle();

    EXPECT_EQ(gateway.row_count("messages"), 1u);
    EXPECT_EQ(sequencer.failure_count(), 0u);
}
