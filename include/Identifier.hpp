#pragma once

/**
 * @file Identifier.hpp
 * @brief Typed SQL names: schemas, tables, columns and schema-qualified tables.
 *
 * Each type wraps the raw, unescaped name supplied by the caller. Nothing is
 * validated on construction; escaping happens when the value is rendered via
 * toString(), operator<< or fmt::format.
 *
 * Rendering uses IdentifierQuoting::WhenNeeded unless told otherwise:
 *
 *     fmt::format("SELECT {} FROM {}", Column("foo bar"), SchemaTable("foo", "baz"))
 *     // SELECT "foo bar" FROM foo.baz
 */

#include "QuotedData.hpp"
#include "SqlEscaper.hpp"
#include "SqlFragment.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace sqlquote {

/**
 * @class Identifier
 * @brief Generic SQL name (table, schema, column, index...).
 *
 * Base for the more specific name types. Comparison operators work on the
 * raw value.
 */
class Identifier {
public:
    Identifier() = default;
    explicit Identifier(std::string name) : m_name(std::move(name)) {}
    explicit Identifier(std::string_view name) : m_name(name) {}
    explicit Identifier(const char* name) : m_name(name) {}

    /// Original, unescaped name.
    const std::string& str() const { return m_name; }

    /// Rendered name using IdentifierQuoting::WhenNeeded.
    std::string toString() const;

    /// Rendered name using the given quoting policy.
    std::string toString(IdentifierQuoting quoting) const;

    /// The raw name as a string literal, e.g. for information_schema lookups.
    QuotedData asQuotedData() const { return QuotedData(m_name); }

    explicit operator std::string() const { return toString(); }

    bool operator==(const Identifier& other) const { return m_name == other.m_name; }
    bool operator!=(const Identifier& other) const { return m_name != other.m_name; }
    bool operator<(const Identifier& other) const { return m_name < other.m_name; }

private:
    std::string m_name;
};

// Schema, Table and Column compare only with their own type, so a column
// is never equal to a table of the same name.

/// Database schema name.
class Schema : public Identifier {
public:
    using Identifier::Identifier;

    bool operator==(const Schema& other) const { return str() == other.str(); }
    bool operator!=(const Schema& other) const { return str() != other.str(); }
    bool operator<(const Schema& other) const { return str() < other.str(); }
};

/// Table column name.
class Column : public Identifier {
public:
    using Identifier::Identifier;

    bool operator==(const Column& other) const { return str() == other.str(); }
    bool operator!=(const Column& other) const { return str() != other.str(); }
    bool operator<(const Column& other) const { return str() < other.str(); }
};

class SchemaTable;

/// Database table name.
class Table : public Identifier {
public:
    using Identifier::Identifier;

    bool operator==(const Table& other) const { return str() == other.str(); }
    bool operator!=(const Table& other) const { return str() != other.str(); }
    bool operator<(const Table& other) const { return str() < other.str(); }

    /// This table qualified by the given schema.
    SchemaTable withSchema(Schema schema) const;
    SchemaTable withSchema(std::string_view schema) const;

    /// Table named <name><postfix>, escaped as one identifier.
    Table withPostfix(std::string_view postfix) const;

    /// Table named <name><separator><postfix>, escaped as one identifier.
    Table withPostfixSep(std::string_view postfix, std::string_view separator) const;
};

/**
 * @class SchemaTable
 * @brief Table name qualified by its schema.
 *
 * Renders as <schema>.<table> with each half escaped independently. The dot
 * separator is never escaped and cannot be supplied by the caller.
 */
class SchemaTable {
public:
    SchemaTable() = default;
    SchemaTable(Schema schema, Table table)
        : m_schema(std::move(schema)), m_table(std::move(table)) {}
    SchemaTable(std::string_view schema, std::string_view table)
        : m_schema(schema), m_table(table) {}

    const Schema& schema() const { return m_schema; }
    const Table& table() const { return m_table; }

    std::string toString() const;
    std::string toString(IdentifierQuoting quoting) const;

    // Postfix goes to the table half only; the schema is unchanged.
    SchemaTable withPostfix(std::string_view postfix) const;
    SchemaTable withPostfixSep(std::string_view postfix, std::string_view separator) const;

    /// 'schema.table' as a string literal.
    QuotedData asQuotedData() const;

    explicit operator std::string() const { return toString(); }

    bool operator==(const SchemaTable& other) const {
        return m_schema == other.m_schema && m_table == other.m_table;
    }
    bool operator!=(const SchemaTable& other) const { return !(*this == other); }
    bool operator<(const SchemaTable& other) const {
        if (m_schema != other.m_schema) return m_schema < other.m_schema;
        return m_table < other.m_table;
    }

private:
    Schema m_schema;
    Table m_table;
};

std::ostream& operator<<(std::ostream& out, const Identifier& identifier);
std::ostream& operator<<(std::ostream& out, const SchemaTable& table);

template<> struct IsSqlFragment<Identifier> : std::true_type {};
template<> struct IsSqlFragment<Schema> : std::true_type {};
template<> struct IsSqlFragment<Table> : std::true_type {};
template<> struct IsSqlFragment<Column> : std::true_type {};
template<> struct IsSqlFragment<SchemaTable> : std::true_type {};

}  // namespace sqlquote
