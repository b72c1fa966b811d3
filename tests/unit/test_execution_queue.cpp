/**
 * @file test_execution_queue.cpp
 * @brief Unit tests for ExecutionQueue ordering, capacity and removal.
 */

#include "service/execution_queue.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace runbox;

namespace {

const SteadyTime kEpoch = std::chrono::steady_clock::now();

QueueSlot make_slot(const std::string& id, int arrival_ms) {
    auto job = std::make_shared<ExecutionJob>();
    job->id = id;
    QueueSlot slot;
    slot.job = std::move(job);
    slot.arrived_at = kEpoch + Millis{arrival_ms};
    return slot;
}

}  // namespace

TEST(ExecutionQueueTest, FifoByArrival) {
    ExecutionQueue queue(8);
    EXPECT_EQ(queue.push(make_slot("a", 1)), 1u);
    EXPECT_EQ(queue.push(make_slot("b", 2)), 2u);
    EXPECT_EQ(queue.push(make_slot("c", 3)), 3u);

    EXPECT_EQ(queue.pop()->job->id, "a");
    EXPECT_EQ(queue.pop()->job->id, "b");
    EXPECT_EQ(queue.pop()->job->id, "c");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ExecutionQueueTest, LateArrivalSortedIn) {
    ExecutionQueue queue(8);
    ASSERT_TRUE(queue.push(make_slot("a", 10)));
    ASSERT_TRUE(queue.push(make_slot("c", 30)));
    EXPECT_EQ(queue.push(make_slot("b", 20)), 2u);

    EXPECT_EQ(queue.position("a"), 1u);
    EXPECT_EQ(queue.position("b"), 2u);
    EXPECT_EQ(queue.position("c"), 3u);
}

TEST(ExecutionQueueTest, SimultaneousArrivalsOrderedById) {
    ExecutionQueue queue(8);
    ASSERT_TRUE(queue.push(make_slot("job-b", 5)));
    ASSERT_TRUE(queue.push(make_slot("job-a", 5)));

    EXPECT_EQ(queue.pop()->job->id, "job-a");
    EXPECT_EQ(queue.pop()->job->id, "job-b");
}

TEST(ExecutionQueueTest, RejectsWhenFull) {
    ExecutionQueue queue(2);
    ASSERT_TRUE(queue.push(make_slot("a", 1)));
    ASSERT_TRUE(queue.push(make_slot("b", 2)));
    EXPECT_TRUE(queue.full());
    EXPECT_FALSE(queue.push(make_slot("c", 3)).has_value());
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_FALSE(queue.contains("c"));
}

TEST(ExecutionQueueTest, ZeroCapacityAcceptsNothing) {
    ExecutionQueue queue(0);
    EXPECT_FALSE(queue.push(make_slot("a", 1)).has_value());
    EXPECT_TRUE(queue.empty());
}

TEST(ExecutionQueueTest, RemoveKeepsOthersInOrder) {
    ExecutionQueue queue(8);
    ASSERT_TRUE(queue.push(make_slot("a", 1)));
    ASSERT_TRUE(queue.push(make_slot("b", 2)));
    ASSERT_TRUE(queue.push(make_slot("c", 3)));

    auto removed = queue.remove("b");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->job->id, "b");
    EXPECT_FALSE(queue.contains("b"));
    EXPECT_EQ(queue.position("c"), 2u);

    EXPECT_EQ(queue.pop()->job->id, "a");
    EXPECT_EQ(queue.pop()->job->id, "c");
}

TEST(ExecutionQueueTest, RemoveUnknownIsNoop) {
    ExecutionQueue queue(4);
    ASSERT_TRUE(queue.push(make_slot("a", 1)));
    EXPECT_FALSE(queue.remove("zzz").has_value());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(ExecutionQueueTest, RemoveFreesCapacity) {
    ExecutionQueue queue(1);
    ASSERT_TRUE(queue.push(make_slot("a", 1)));
    ASSERT_TRUE(queue.remove("a").has_value());
    EXPECT_TRUE(queue.push(make_slot("b", 2)).has_value());
}

TEST(ExecutionQueueTest, DrainHeadFirst) {
    ExecutionQueue queue(4);
    ASSERT_TRUE(queue.push(make_slot("a", 1)));
    ASSERT_TRUE(queue.push(make_slot("b", 2)));

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].job->id, "a");
    EXPECT_EQ(drained[1].job->id, "b");
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.contains("a"));
}

TEST(ExecutionQueueTest, PromiseTravelsWithSlot) {
    ExecutionQueue queue(2);
    auto slot = make_slot("a", 1);
    auto future = slot.promise.get_future();
    ASSERT_TRUE(queue.push(std::move(slot)));

    auto popped = queue.pop();
    ASSERT_TRUE(popped.has_value());
    ExecutionResult result;
    result.job_id = "a";
    result.state = TerminalState::Completed;
    popped->promise.set_value(result);

    auto delivered = future.get();
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(delivered->state, TerminalState::Completed);
}
