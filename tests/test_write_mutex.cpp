#include <gtest/gtest.h>
#include "WriteMutex.hpp"
#include "WriteMutexRegistry.hpp"
#include <thread>
#include <vector>
#include <chrono>

using namespace sqltune;
using namespace std::chrono_literals;

class WriteMutexTest : public ::testing::Test {
protected:
    // Poll until n callers are queued behind the holder
    static bool waitForWaiters(const WriteMutex& mutex, size_t n) {
        for (int i = 0; i < 500; ++i) {
            if (mutex.waitingCount() == n) return true;
            std::this_thread::sleep_for(2ms);
        }
        return false;
    }
};

TEST_F(WriteMutexTest, LockAndUnlock) {
    WriteMutex mutex;
    EXPECT_FALSE(mutex.isLocked());

    mutex.lock();
    EXPECT_TRUE(mutex.isLocked());
    EXPECT_EQ(mutex.waitingCount(), 0u);

    mutex.unlock();
    EXPECT_FALSE(mutex.isLocked());
}

TEST_F(WriteMutexTest, TryLockFailsWhileHeld) {
    WriteMutex mutex;
    EXPECT_TRUE(mutex.tryLock());
    EXPECT_FALSE(mutex.tryLock());
    mutex.unlock();
    EXPECT_TRUE(mutex.tryLock());
    mutex.unlock();
}

TEST_F(WriteMutexTest, UnlockWhenFreeIsIgnored) {
    WriteMutex mutex;
    mutex.unlock();
    EXPECT_FALSE(mutex.isLocked());

    // Still usable afterwards
    EXPECT_TRUE(mutex.tryLock());
    mutex.unlock();
}

TEST_F(WriteMutexTest, UnlockFromAnotherThread) {
    WriteMutex mutex;
    mutex.lock();
    std::thread other([&mutex] { mutex.unlock(); });
    other.join();
    EXPECT_FALSE(mutex.isLocked());
}

TEST_F(WriteMutexTest, WaitersAdmittedInArrivalOrder) {
    WriteMutex mutex;
    mutex.lock();

    std::mutex orderMutex;
    std::vector<int> order;
    std::vector<std::thread> threads;

    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i] {
            mutex.lock();
            {
                std::lock_guard<std::mutex> guard(orderMutex);
                order.push_back(i);
            }
            mutex.unlock();
        });
        // Make sure thread i has queued before starting i + 1
        ASSERT_TRUE(waitForWaiters(mutex, static_cast<size_t>(i + 1)));
    }

    mutex.unlock();
    for (auto& t : threads) t.join();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
    EXPECT_FALSE(mutex.isLocked());
    EXPECT_EQ(mutex.waitingCount(), 0u);
}

TEST_F(WriteMutexTest, TryLockDoesNotJumpTheQueue) {
    WriteMutex mutex;
    mutex.lock();

    std::thread waiter([&mutex] {
        mutex.lock();
        mutex.unlock();
    });
    ASSERT_TRUE(waitForWaiters(mutex, 1));

    mutex.unlock();
    waiter.join();
    EXPECT_TRUE(mutex.tryLock());
    mutex.unlock();
}

// Registry
TEST_F(WriteMutexTest, RegistrySharesMutexPerPath) {
    WriteMutexRegistry registry;

    auto a = registry.attach("/tmp/a.db");
    auto b = registry.attach("/tmp/a.db");
    auto c = registry.attach("/tmp/c.db");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(registry.refCount("/tmp/a.db"), 2u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find("/tmp/a.db"), a);
}

TEST_F(WriteMutexTest, RegistryRemovesEntryOnLastDetach) {
    WriteMutexRegistry registry;
    registry.attach("/tmp/a.db");
    registry.attach("/tmp/a.db");

    registry.detach("/tmp/a.db");
    EXPECT_EQ(registry.refCount("/tmp/a.db"), 1u);
    EXPECT_NE(registry.find("/tmp/a.db"), nullptr);

    registry.detach("/tmp/a.db");
    EXPECT_EQ(registry.refCount("/tmp/a.db"), 0u);
    EXPECT_EQ(registry.find("/tmp/a.db"), nullptr);
    EXPECT_EQ(registry.size(), 0u);

    // Unknown paths are ignored
    registry.detach("/tmp/never.db");
    EXPECT_EQ(registry.size(), 0u);
}
