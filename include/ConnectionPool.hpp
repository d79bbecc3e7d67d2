#pragma once

#include <cstddef>
#include <string>

namespace sqltune {

class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Pool statistics
    virtual size_t availableCount() const = 0;
    virtual size_t totalCount() const = 0;
    virtual size_t waitingCount() const = 0;

    // Health check
    virtual bool healthCheck() = 0;

    // Close all connections and fail pending waiters
    virtual void destroy() = 0;

    virtual bool isInitialized() const = 0;

    // Path the write mutex is keyed by (":memory:" for in-memory databases)
    virtual std::string databasePath() const = 0;

protected:
    ConnectionPool() = default;
};

}  // namespace sqltune
