#pragma once

#include <string>
#include <vector>
#include <optional>

namespace sqltune {

struct IndexInfo {
    std::string name;
    std::string table;
    std::vector<std::string> columns;  // in index order
    bool unique = false;
};

// Abstract base class for schema catalog lookups
class SchemaManager {
public:
    virtual ~SchemaManager() = default;

    // User tables; throws if the catalog cannot be read
    virtual std::vector<std::string> getTables() = 0;

    // Explicit indexes of a table; nullopt if the lookup failed
    virtual std::optional<std::vector<IndexInfo>> getIndexes(const std::string& table) = 0;

    // File backing the main database; nullopt or empty for in-memory databases
    virtual std::optional<std::string> getDatabaseFile() = 0;

protected:
    SchemaManager() = default;
};

}  // namespace sqltune
