// Concurrent map tests
//
// Single-threaded semantics plus readers and writers racing on shared keys.

#include "cache/concurrent_map.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace deepclone::cache;

class ConcurrentMapTest : public ::testing::Test {
protected:
    ConcurrentMap<std::string, int> map_;
};

// ============================================================================
// Basic operations
// ============================================================================

TEST_F(ConcurrentMapTest, FindMissingReturnsNullopt) {
    EXPECT_FALSE(map_.find("missing").has_value());
    EXPECT_FALSE(map_.contains("missing"));
    EXPECT_TRUE(map_.empty());
}

TEST_F(ConcurrentMapTest, TryEmplaceKeepsFirstValue) {
    auto [first, inserted] = map_.try_emplace("a", 1);
    EXPECT_TRUE(inserted);
    EXPECT_EQ(first, 1);

    auto [second, inserted_again] = map_.try_emplace("a", 2);
    EXPECT_FALSE(inserted_again);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(*map_.find("a"), 1);
}

TEST_F(ConcurrentMapTest, InsertOrAssignOverwrites) {
    map_.insert_or_assign("a", 1);
    map_.insert_or_assign("a", 5);
    EXPECT_EQ(*map_.find("a"), 5);
    EXPECT_EQ(map_.size(), 1u);
}

TEST_F(ConcurrentMapTest, EraseAndClear) {
    map_.try_emplace("a", 1);
    map_.try_emplace("b", 2);

    EXPECT_TRUE(map_.erase("a"));
    EXPECT_FALSE(map_.erase("a"));
    EXPECT_EQ(map_.size(), 1u);

    map_.clear();
    EXPECT_TRUE(map_.empty());
}

TEST_F(ConcurrentMapTest, VisitSeesStoredValue) {
    map_.try_emplace("a", 7);

    int seen = 0;
    EXPECT_TRUE(map_.visit("a", [&seen](const int& value) { seen = value; }));
    EXPECT_EQ(seen, 7);
    EXPECT_FALSE(map_.visit("b", [&seen](const int&) { seen = -1; }));
    EXPECT_EQ(seen, 7);
}

TEST_F(ConcurrentMapTest, SnapshotCoversAllShards) {
    for (int i = 0; i < 100; ++i) {
        map_.try_emplace("key" + std::to_string(i), i);
    }

    auto entries = map_.snapshot();
    ASSERT_EQ(entries.size(), 100u);

    int sum = 0;
    map_.for_each([&sum](const std::string&, const int& value) { sum += value; });
    EXPECT_EQ(sum, 4950);
}

TEST(ConcurrentMapShardTest, SingleShardStillWorks) {
    ConcurrentMap<int, int, std::hash<int>, std::equal_to<int>, 1> map;
    static_assert(decltype(map)::shard_count() == 1);

    for (int i = 0; i < 10; ++i) {
        map.try_emplace(i, i * i);
    }
    EXPECT_EQ(map.size(), 10u);
    EXPECT_EQ(*map.find(3), 9);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ConcurrentMapTest, ConcurrentInsertsOfDistinctKeys) {
    constexpr int num_threads = 8;
    constexpr int inserts_per_thread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < inserts_per_thread; ++i) {
                map_.try_emplace(std::to_string(t) + ":" + std::to_string(i), i);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map_.size(), static_cast<size_t>(num_threads * inserts_per_thread));
}

TEST_F(ConcurrentMapTest, RacingTryEmplaceHasOneWinner) {
    constexpr int num_threads = 8;
    std::atomic<int> winners{0};
    std::vector<int> observed(num_threads, -1);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, &winners, &observed]() {
            auto [value, inserted] = map_.try_emplace("shared", t);
            if (inserted) {
                winners.fetch_add(1);
            }
            observed[t] = value;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    const int stored = *map_.find("shared");
    EXPECT_TRUE(std::all_of(observed.begin(), observed.end(),
                            [stored](int value) { return value == stored; }));
}

TEST_F(ConcurrentMapTest, ReadersRunAlongsideWriters) {
    map_.try_emplace("stable", 1);
    std::atomic<bool> stop{false};
    std::atomic<int> misses{0};

    std::thread writer([this, &stop]() {
        for (int i = 0; i < 1000; ++i) {
            map_.insert_or_assign("churn" + std::to_string(i % 10), i);
        }
        stop = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([this, &stop, &misses]() {
            while (!stop) {
                if (!map_.contains("stable")) {
                    misses.fetch_add(1);
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(misses.load(), 0);
    EXPECT_EQ(map_.size(), 11u);
}
