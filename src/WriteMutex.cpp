#include "WriteMutex.hpp"
#include <spdlog/spdlog.h>

namespace sqltune {

void WriteMutex::lock() {
    std::unique_lock<std::mutex> lock(m_mutex);
    const uint64_t ticket = m_nextTicket++;
    m_cv.wait(lock, [this, ticket] { return !m_locked && m_serving == ticket; });
    m_locked = true;
}

bool WriteMutex::tryLock() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Only when nobody holds it and nobody is queued ahead of us
    if (m_locked || m_serving != m_nextTicket) {
        return false;
    }
    ++m_nextTicket;
    m_locked = true;
    return true;
}

void WriteMutex::unlock() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_locked) {
            spdlog::warn("Write mutex unlocked while not held; ignoring");
            return;
        }
        m_locked = false;
        ++m_serving;
    }
    // Every waiter re-checks its ticket, only the next one proceeds
    m_cv.notify_all();
}

bool WriteMutex::isLocked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_locked;
}

size_t WriteMutex::waitingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t queued = m_nextTicket - m_serving;
    if (m_locked) --queued;
    return static_cast<size_t>(queued);
}

}  // namespace sqltune
