#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace sqltune {

using Blob = std::vector<uint8_t>;

// A bound parameter or result cell: NULL, number, big integer, text or blob
using Value = std::variant<std::nullptr_t, double, int64_t, std::string, Blob>;

using Row = std::vector<Value>;

// SQL text plus positional parameters, as produced by a query compiler
struct CompiledQuery {
    std::string sql;
    std::vector<Value> parameters;

    static CompiledQuery raw(std::string sql) {
        return CompiledQuery{std::move(sql), {}};
    }
};

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    std::optional<int64_t> numAffectedRows;  // set for statements that write
    std::optional<int64_t> insertId;
};

}  // namespace sqltune
