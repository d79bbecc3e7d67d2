#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <condition_variable>

namespace sqltune {

// Process-level write lock for one database file.
//
// lock() blocks until the mutex is free; waiters are admitted in the order
// they called lock(). unlock() may be called from any thread, not only the
// one that locked. Not reentrant. Satisfies BasicLockable.
class WriteMutex {
public:
    WriteMutex() = default;

    // Non-copyable
    WriteMutex(const WriteMutex&) = delete;
    WriteMutex& operator=(const WriteMutex&) = delete;

    void lock();
    bool tryLock();
    void unlock();

    bool isLocked() const;
    size_t waitingCount() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    uint64_t m_nextTicket = 0;   // ticket handed to the next lock() caller
    uint64_t m_serving = 0;      // ticket allowed to own the mutex
    bool m_locked = false;
};

}  // namespace sqltune
