#include <gtest/gtest.h>
#include <KeyedLockTable.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class KeyedLockTableTest : public ::testing::Test {
protected:
    KeyedLockTable<std::string> table;
};

TEST_F(KeyedLockTableTest, AcquireAndReleaseFreesEntry) {
    {
        auto guard = table.tryLockFor("s1:p1", 100ms);
        ASSERT_TRUE(guard);
        EXPECT_TRUE(table.isLocked("s1:p1"));
        EXPECT_EQ(table.size(), 1u);
    }

    EXPECT_FALSE(table.isLocked("s1:p1"));
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(KeyedLockTableTest, SameKeyTimesOutWhileHeld) {
    auto holder = table.tryLockFor("s1:p1", 100ms);
    ASSERT_TRUE(holder);

    std::atomic<bool> acquired{true};
    std::thread contender([this, &acquired]() {
        auto guard = table.tryLockFor("s1:p1", 30ms);
        acquired = guard.owns();
    });
    contender.join();

    EXPECT_FALSE(acquired);
    EXPECT_TRUE(table.isLocked("s1:p1"));
}

TEST_F(KeyedLockTableTest, DifferentKeysDoNotBlock) {
    auto first = table.tryLockFor("s1:p1", 100ms);
    auto second = table.tryLockFor("s1:p2", 10ms);

    EXPECT_TRUE(first);
    EXPECT_TRUE(second);
    EXPECT_EQ(table.size(), 2u);
}

TEST_F(KeyedLockTableTest, WaiterAcquiresAfterRelease) {
    auto holder = table.tryLockFor("key", 100ms);
    ASSERT_TRUE(holder);

    std::atomic<bool> acquired{false};
    std::thread waiter([this, &acquired]() {
        auto guard = table.tryLockFor("key", 2000ms);
        acquired = guard.owns();
    });

    std::this_thread::sleep_for(20ms);
    holder.release();
    waiter.join();

    EXPECT_TRUE(acquired);
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(KeyedLockTableTest, MovedGuardReleasesOnce) {
    auto guard = table.tryLockFor("key", 100ms);
    KeyedLockTable<std::string>::Guard moved = std::move(guard);

    EXPECT_FALSE(guard.owns());
    EXPECT_TRUE(moved.owns());

    moved.release();
    EXPECT_FALSE(table.isLocked("key"));
}

// Критическая секция под ключом не выполняется двумя потоками одновременно
TEST_F(KeyedLockTableTest, SerializesCriticalSection) {
    const int THREADS = 8;
    const int ITERATIONS = 200;

    int counter = 0;  // без атомика: защищён только ключом
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                auto guard = table.tryLockFor("hot", 5000ms);
                ASSERT_TRUE(guard);
                if (++inside > 1) overlap = true;
                ++counter;
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_FALSE(overlap);
    EXPECT_EQ(counter, THREADS * ITERATIONS);
    EXPECT_EQ(table.size(), 0u);
}
