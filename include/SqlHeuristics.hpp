#pragma once

#include <string>
#include <vector>

namespace sqltune {
namespace heuristics {

// Lexical helpers used to turn observed SQL text into query patterns.
// They are best-effort and deterministic, not a SQL parser: the accepted
// shapes are SELECT ... FROM and DELETE FROM statements with optional
// JOIN ... ON, WHERE, ORDER BY and LIMIT clauses. Columns are still read
// from UPDATE statements, but their table is only known when the caller
// names it.

// Table name recorded when none can be found
constexpr const char kUnknownTable[] = "unknown";

// Replace parameters, quoted literals and bare integers with '?', collapse
// whitespace and lowercase. Used as the pattern key.
std::string normalizeQuery(const std::string& sql);

// First identifier after FROM, or kUnknownTable
std::string extractTableName(const std::string& sql);

// Tokens immediately before a comparison operator inside the WHERE clause
std::vector<std::string> extractWhereColumns(const std::string& sql);

// Comma separated ORDER BY items, without direction keywords
std::vector<std::string> extractOrderByColumns(const std::string& sql);

// Left-hand tokens of '=' conditions in each JOIN ... ON clause
std::vector<std::string> extractJoinColumns(const std::string& sql);

// Wrap in double quotes, doubling embedded quotes
std::string quoteIdentifier(const std::string& name);

}  // namespace heuristics
}  // namespace sqltune
