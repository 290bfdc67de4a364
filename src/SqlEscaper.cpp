/**
 * @file SqlEscaper.cpp
 * @brief Implementation of the identifier and literal escaping routines.
 *
 * Escaping Conventions:
 * - Identifiers: Double quotes with doubled double-quotes for escaping
 *   (e.g., "column""name" for a column containing a double quote)
 * - Strings: Single quotes with doubled single-quotes for escaping
 *   (e.g., 'O''Brien' for the string O'Brien)
 */

#include "SqlEscaper.hpp"
#include <algorithm>
#include <iterator>
#include <cctype>

namespace sqlquote {

namespace {

// SQL:2016 reserved words that are common across dialects. A name on this
// list is quoted even when it is otherwise plain.
constexpr std::string_view kReservedWords[] = {
    "ALL", "ALTER", "AND", "ANY", "ARRAY", "AS", "ASC", "BETWEEN", "BIGINT",
    "BOOLEAN", "BOTH", "BY", "CASE", "CAST", "CHAR", "CHECK", "COLUMN",
    "CONSTRAINT", "CREATE", "CROSS", "CURRENT", "DEFAULT", "DELETE", "DESC",
    "DISTINCT", "DOUBLE", "DROP", "ELSE", "END", "EXCEPT", "EXISTS", "FALSE",
    "FETCH", "FLOAT", "FOR", "FOREIGN", "FROM", "FULL", "GRANT", "GROUP",
    "HAVING", "IN", "INNER", "INSERT", "INT", "INTEGER", "INTERSECT", "INTO",
    "IS", "JOIN", "LEADING", "LEFT", "LIKE", "LIMIT", "NATURAL", "NOT",
    "NULL", "OF", "OFFSET", "ON", "ONLY", "OR", "ORDER", "OUTER", "PRIMARY",
    "REAL", "REFERENCES", "RETURNING", "REVOKE", "RIGHT", "ROW", "ROWS",
    "SELECT", "SET", "SMALLINT", "SOME", "TABLE", "THEN", "TO", "TRAILING",
    "TRUE", "UNION", "UNIQUE", "UPDATE", "USER", "USING", "VALUES", "VARCHAR",
    "VIEW", "WHEN", "WHERE", "WINDOW", "WITH", "TINYINT", "SCHEMA", "INDEX",
};

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

std::string quote(std::string_view text, char quoteChar) {
    std::string result;
    result.reserve(text.size() + 2);
    result += quoteChar;
    SqlEscaper::appendEscaped(result, text, quoteChar);
    result += quoteChar;
    return result;
}

}  // namespace

std::string SqlEscaper::quoteIdentifier(std::string_view identifier) {
    return quote(identifier, '"');
}

std::string SqlEscaper::quoteLiteral(std::string_view value) {
    return quote(value, '\'');
}

std::string SqlEscaper::formatIdentifier(std::string_view identifier,
                                         IdentifierQuoting quoting) {
    if (quoting == IdentifierQuoting::WhenNeeded && isPlainIdentifier(identifier)) {
        return std::string(identifier);
    }
    return quoteIdentifier(identifier);
}

bool SqlEscaper::isPlainIdentifier(std::string_view identifier) {
    if (identifier.empty() || isAsciiDigit(identifier.front())) {
        return false;
    }

    for (char c : identifier) {
        if (!isAsciiAlpha(c) && !isAsciiDigit(c) && c != '_') {
            return false;
        }
    }

    return !isReservedWord(identifier);
}

bool SqlEscaper::isReservedWord(std::string_view word) {
    std::string upper(word);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    return std::find(std::begin(kReservedWords), std::end(kReservedWords), upper) !=
           std::end(kReservedWords);
}

void SqlEscaper::appendEscaped(std::string& out, std::string_view text, char quoteChar) {
    for (char c : text) {
        if (c == quoteChar) {
            out += quoteChar;  // Double the quote
        }
        out += c;
    }
}

std::string SqlEscaper::join(const std::vector<std::string>& parts) {
    size_t total = 0;
    for (const auto& part : parts) {
        total += part.size();
    }

    std::string result;
    result.reserve(total);
    for (const auto& part : parts) {
        result += part;
    }
    return result;
}

}  // namespace sqlquote
