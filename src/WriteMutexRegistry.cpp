#include "WriteMutexRegistry.hpp"
#include <spdlog/spdlog.h>

namespace sqltune {

std::shared_ptr<WriteMutex> WriteMutexRegistry::attach(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto& entry = m_entries[path];
    if (!entry.mutex) {
        entry.mutex = std::make_shared<WriteMutex>();
        spdlog::debug("Created write mutex for '{}'", path);
    }
    ++entry.refs;
    return entry.mutex;
}

void WriteMutexRegistry::detach(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(path);
    if (it == m_entries.end()) {
        spdlog::warn("Detach from unknown write mutex '{}'", path);
        return;
    }

    if (--it->second.refs == 0) {
        m_entries.erase(it);
        spdlog::debug("Removed write mutex for '{}'", path);
    }
}

std::shared_ptr<WriteMutex> WriteMutexRegistry::find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(path);
    return it != m_entries.end() ? it->second.mutex : nullptr;
}

size_t WriteMutexRegistry::refCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(path);
    return it != m_entries.end() ? it->second.refs : 0;
}

size_t WriteMutexRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

}  // namespace sqltune
