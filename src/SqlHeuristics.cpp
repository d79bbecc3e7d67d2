#include "SqlHeuristics.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace sqltune {
namespace heuristics {

namespace {

const auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// 'text' -> ? so literals can't be mistaken for columns or keywords
std::string maskLiterals(const std::string& sql) {
    static const std::regex literal("'[^']*'");
    return std::regex_replace(sql, literal, "?");
}

// "t"."col", `col`, [col], t.col -> col
std::string stripIdentifier(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c != '"' && c != '`' && c != '[' && c != ']') out += c;
    }
    auto dot = out.rfind('.');
    if (dot != std::string::npos) out = out.substr(dot + 1);
    return out;
}

bool isColumnName(const std::string& name) {
    if (name.empty() || name == "?") return false;
    return !std::all_of(name.begin(), name.end(),
                        [](unsigned char c) { return std::isdigit(c); });
}

void appendUnique(std::vector<std::string>& out, const std::string& name) {
    if (!isColumnName(name)) return;
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
    }
}

// Offset of the first match of 're' in s at or after 'from', or s.size()
size_t findFrom(const std::string& s, size_t from, const std::regex& re) {
    std::smatch m;
    auto begin = s.begin() + static_cast<std::ptrdiff_t>(from);
    if (std::regex_search(begin, s.end(), m, re)) {
        return from + static_cast<size_t>(m.position(0));
    }
    return s.size();
}

}  // namespace

std::string normalizeQuery(const std::string& sql) {
    static const std::regex dollarParam("\\$\\d+");
    static const std::regex numberedParam("\\?\\d+");
    static const std::regex literal("'[^']*'");
    static const std::regex integer("\\b\\d+\\b");
    static const std::regex whitespace("\\s+");

    std::string out = std::regex_replace(sql, dollarParam, "?");
    out = std::regex_replace(out, numberedParam, "?");
    out = std::regex_replace(out, literal, "?");
    out = std::regex_replace(out, integer, "?");
    out = std::regex_replace(out, whitespace, " ");
    out = trim(out);
    std::transform(out.begin(), out.end(), out.begin(), ::tolower);
    return out;
}

std::string extractTableName(const std::string& sql) {
    static const std::regex from("\\bFROM\\s+[\"`\\[]?(\\w+)", kFlags);
    std::smatch m;
    if (std::regex_search(sql, m, from)) {
        return m[1].str();
    }
    return kUnknownTable;
}

std::vector<std::string> extractWhereColumns(const std::string& sql) {
    static const std::regex where("\\bWHERE\\b", kFlags);
    static const std::regex clauseEnd("\\b(ORDER\\s+BY|GROUP\\s+BY|HAVING|LIMIT)\\b|;", kFlags);
    static const std::regex comparison("([\\w.\"`\\[\\]]+)\\s*(<=|>=|<>|!=|=|<|>)");

    std::vector<std::string> columns;
    const std::string masked = maskLiterals(sql);

    std::smatch m;
    if (!std::regex_search(masked, m, where)) return columns;
    size_t start = static_cast<size_t>(m.position(0) + m.length(0));
    size_t end = findFrom(masked, start, clauseEnd);
    const std::string clause = masked.substr(start, end - start);

    for (std::sregex_iterator it(clause.begin(), clause.end(), comparison), last; it != last; ++it) {
        appendUnique(columns, stripIdentifier((*it)[1].str()));
    }
    return columns;
}

std::vector<std::string> extractOrderByColumns(const std::string& sql) {
    static const std::regex orderBy("\\bORDER\\s+BY\\s+", kFlags);
    static const std::regex clauseEnd("\\b(LIMIT|OFFSET)\\b|;", kFlags);

    std::vector<std::string> columns;
    const std::string masked = maskLiterals(sql);

    std::smatch m;
    if (!std::regex_search(masked, m, orderBy)) return columns;
    size_t start = static_cast<size_t>(m.position(0) + m.length(0));
    size_t end = findFrom(masked, start, clauseEnd);
    const std::string clause = masked.substr(start, end - start);

    size_t pos = 0;
    while (pos <= clause.size()) {
        size_t comma = clause.find(',', pos);
        if (comma == std::string::npos) comma = clause.size();
        std::string item = trim(clause.substr(pos, comma - pos));
        pos = comma + 1;

        // Expressions like lower(name) can't be served by a plain column index
        if (item.empty() || item.find('(') != std::string::npos) continue;

        // "col DESC NULLS LAST" -> "col"
        auto space = item.find_first_of(" \t\r\n");
        appendUnique(columns, stripIdentifier(item.substr(0, space)));
    }
    return columns;
}

std::vector<std::string> extractJoinColumns(const std::string& sql) {
    static const std::regex joinOn(
        "\\bJOIN\\s+[\"`\\[]?\\w+[\"`\\]]?(\\s+(AS\\s+)?\\w+)?\\s+ON\\s+", kFlags);
    static const std::regex conditionEnd(
        "\\b(JOIN|WHERE|ORDER|GROUP|LIMIT|LEFT|RIGHT|INNER|CROSS|FULL|NATURAL)\\b|;", kFlags);
    static const std::regex equality("([\\w.\"`\\[\\]]+)\\s*=");

    std::vector<std::string> columns;
    const std::string masked = maskLiterals(sql);

    for (std::sregex_iterator it(masked.begin(), masked.end(), joinOn), last; it != last; ++it) {
        size_t start = static_cast<size_t>(it->position(0) + it->length(0));
        size_t end = findFrom(masked, start, conditionEnd);
        const std::string condition = masked.substr(start, end - start);

        for (std::sregex_iterator eq(condition.begin(), condition.end(), equality), stop;
             eq != stop; ++eq) {
            appendUnique(columns, stripIdentifier((*eq)[1].str()));
        }
    }
    return columns;
}

std::string quoteIdentifier(const std::string& name) {
    std::string result = "\"";
    for (char c : name) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

}  // namespace heuristics
}  // namespace sqltune
