#pragma once

#include "WriteMutex.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace sqltune {

// Shares one WriteMutex per database file among every pool in the process.
// Entries are reference-counted by attach()/detach() and erased when the
// last pool detaches.
class WriteMutexRegistry {
public:
    WriteMutexRegistry() = default;
    ~WriteMutexRegistry() = default;

    // Non-copyable
    WriteMutexRegistry(const WriteMutexRegistry&) = delete;
    WriteMutexRegistry& operator=(const WriteMutexRegistry&) = delete;

    // Get (or create) the mutex for a path and take a reference on it
    std::shared_ptr<WriteMutex> attach(const std::string& path);

    // Drop a reference; the entry is removed when the count reaches zero
    void detach(const std::string& path);

    std::shared_ptr<WriteMutex> find(const std::string& path) const;
    size_t refCount(const std::string& path) const;
    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<WriteMutex> mutex;
        size_t refs = 0;
    };

    std::unordered_map<std::string, Entry> m_entries;
    mutable std::mutex m_mutex;
};

}  // namespace sqltune
