#pragma once

/**
 * @file SqlEscaper.hpp
 * @brief Identifier and string literal escaping for SQL text.
 *
 * Every typed fragment in sql-quote (Column, Table, QuotedData, ...) renders
 * through one of the routines declared here. They follow the ANSI
 * conventions: double quotes for identifiers, single quotes for string
 * literals, and an embedded quote character is escaped by doubling it.
 */

#include <string>
#include <string_view>
#include <vector>

namespace sqlquote {

/**
 * @brief How an identifier is rendered.
 *
 * - WhenNeeded: plain names (see SqlEscaper::isPlainIdentifier) are emitted
 *   bare, everything else is double-quoted.
 * - Always: the name is always double-quoted.
 */
enum class IdentifierQuoting {
    WhenNeeded,
    Always
};

/**
 * @class SqlEscaper
 * @brief Static escaping routines. The class holds no state.
 *
 * All routines are total over their input: any byte sequence, including the
 * empty string, embedded NUL and control characters, produces a well-formed
 * token. Backslashes get no special treatment, so dialects that use
 * backslash escapes inside literals (MySQL without NO_BACKSLASH_ESCAPES) are
 * not supported.
 */
class SqlEscaper {
public:
    /**
     * @brief Render a double-quoted identifier.
     * @param identifier Raw identifier text.
     * @return Identifier wrapped in double quotes with internal quotes doubled.
     *
     * Example: my table -> "my table", col"name -> "col""name", empty -> ""
     */
    static std::string quoteIdentifier(std::string_view identifier);

    /**
     * @brief Render a single-quoted string literal.
     * @param value Raw literal value.
     * @return Value wrapped in single quotes with internal quotes doubled.
     *
     * Example: O'Brien -> 'O''Brien', empty -> ''
     */
    static std::string quoteLiteral(std::string_view value);

    /**
     * @brief Render an identifier according to the given quoting policy.
     *
     * With IdentifierQuoting::WhenNeeded a plain identifier is returned as is
     * and anything else goes through quoteIdentifier().
     */
    static std::string formatIdentifier(std::string_view identifier,
                                        IdentifierQuoting quoting = IdentifierQuoting::WhenNeeded);

    /**
     * @brief True if the name can appear unquoted.
     *
     * A plain identifier is non-empty, made of ASCII letters, digits and
     * underscores, does not start with a digit and is not a reserved word.
     */
    static bool isPlainIdentifier(std::string_view identifier);

    /// True if the name is an ANSI SQL reserved word (case-insensitive).
    static bool isReservedWord(std::string_view word);

    // Append the escaped body of a quoted token (no surrounding quotes).
    static void appendEscaped(std::string& out, std::string_view text, char quote);

    // Concatenate parts into one string.
    static std::string join(const std::vector<std::string>& parts);
};

}  // namespace sqlquote
