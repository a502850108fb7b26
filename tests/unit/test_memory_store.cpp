#include <gtest/gtest.h>
#include "memory_store.h"
#include "errors.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace capsulerun;

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ms = 1000000;
        store = std::make_unique<MemoryStore>([this]() { return now_ms.load(); });
    }

    void advance_seconds(int seconds) { now_ms += static_cast<int64_t>(seconds) * 1000; }

    std::atomic<int64_t> now_ms{0};
    std::unique_ptr<MemoryStore> store;
};

// ============================================================================
// Values and Expiry
// ============================================================================

TEST_F(MemoryStoreTest, SetThenGetReturnsValue) {
    store->set("k", "v");
    EXPECT_EQ(store->get("k"), "v");
    EXPECT_FALSE(store->get("missing").has_value());
}

TEST_F(MemoryStoreTest, ExpiredKeyDisappears) {
    // Given: A key with a 10 second lifetime
    store->set("k", "v", 10);
    EXPECT_EQ(store->ttl("k"), 10);

    // When: 10 seconds pass
    advance_seconds(10);

    // Then: The key is gone
    EXPECT_FALSE(store->get("k").has_value());
    EXPECT_EQ(store->ttl("k"), -2);
}

TEST_F(MemoryStoreTest, TtlReportsNoExpiryAndRoundsUp) {
    store->set("forever", "v");
    EXPECT_EQ(store->ttl("forever"), -1);

    store->set("short", "v", 5);
    now_ms += 4500;
    EXPECT_EQ(store->ttl("short"), 1);
}

TEST_F(MemoryStoreTest, SetIfAbsentRespectsLiveValues) {
    EXPECT_TRUE(store->set_if_absent("k", "first", 5));
    EXPECT_FALSE(store->set_if_absent("k", "second", 5));
    EXPECT_EQ(store->get("k"), "first");

    // Once expired the slot is free again
    advance_seconds(6);
    EXPECT_TRUE(store->set_if_absent("k", "third", 5));
    EXPECT_EQ(store->get("k"), "third");
}

TEST_F(MemoryStoreTest, CompareAndSetOnlyOnExpectedValue) {
    store->set("k", "a");

    EXPECT_FALSE(store->compare_and_set("k", "b", "c"));
    EXPECT_EQ(store->get("k"), "a");

    EXPECT_TRUE(store->compare_and_set("k", "a", "c"));
    EXPECT_EQ(store->get("k"), "c");

    EXPECT_FALSE(store->compare_and_set("missing", "", "x"));
}

TEST_F(MemoryStoreTest, DelReportsWhetherKeyExisted) {
    store->set("k", "v");
    EXPECT_TRUE(store->del("k"));
    EXPECT_FALSE(store->del("k"));
}

// ============================================================================
// Counters
// ============================================================================

TEST_F(MemoryStoreTest, IncrByTreatsMissingAsZero) {
    EXPECT_EQ(store->incr_by("c", 1), 1);
    EXPECT_EQ(store->incr_by("c", 5), 6);
    EXPECT_EQ(store->incr_by("c", -7), -1);
}

TEST_F(MemoryStoreTest, IncrByKeepsExpiryUnlessRefreshed) {
    store->incr_by("c", 1, 10);
    advance_seconds(6);

    // No ttl: expiry untouched
    store->incr_by("c", 1);
    EXPECT_EQ(store->ttl("c"), 4);

    // With ttl: expiry refreshed
    store->incr_by("c", 0, 10);
    EXPECT_EQ(store->ttl("c"), 10);
    EXPECT_EQ(store->get("c"), "2");
}

TEST_F(MemoryStoreTest, IncrByOnTextThrows) {
    store->set("c", "open");
    EXPECT_THROW(store->incr_by("c", 1), StoreError);
}

// ============================================================================
// Lists
// ============================================================================

TEST_F(MemoryStoreTest, PopReturnsFifoOrderAndPrefersFirstList) {
    store->push_tail("low", "l1");
    store->push_tail("high", "h1");
    store->push_tail("high", "h2");

    auto first = store->pop_head_blocking({"high", "low"}, 0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, "high");
    EXPECT_EQ(first->second, "h1");

    EXPECT_EQ(store->pop_head_blocking({"high", "low"}, 0)->second, "h2");
    EXPECT_EQ(store->pop_head_blocking({"high", "low"}, 0)->second, "l1");
    EXPECT_FALSE(store->pop_head_blocking({"high", "low"}, 0).has_value());
    EXPECT_EQ(store->list_length("high"), 0);
}

TEST_F(MemoryStoreTest, BlockingPopWakesOnPush) {
    // Given: A consumer blocked on an empty list
    std::optional<std::pair<std::string, std::string>> popped;
    std::thread consumer([&]() {
        popped = store->pop_head_blocking({"q"}, 5);
    });

    // When: A producer pushes
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store->push_tail("q", "job-1");
    consumer.join();

    // Then: The consumer receives it
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped->second, "job-1");
}

TEST_F(MemoryStoreTest, BlockingPopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto popped = store->pop_head_blocking({"q"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(popped.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
}

// ============================================================================
// Failure Injection
// ============================================================================

TEST_F(MemoryStoreTest, FailNextThrowsForCountedOperations) {
    store->fail_next(2);

    EXPECT_THROW(store->get("k"), StoreError);
    EXPECT_THROW(store->set("k", "v"), StoreError);
    EXPECT_NO_THROW(store->set("k", "v"));
    EXPECT_EQ(store->get("k"), "v");
}
