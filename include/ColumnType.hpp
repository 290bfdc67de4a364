#pragma once

/**
 * @file ColumnType.hpp
 * @brief Dialect-specific column types for DDL generation.
 *
 * A dialect is an empty tag type. SqlDataType<Dialect, T> maps a C++ type to
 * the name the dialect uses for it and is declared with
 * SQLQUOTE_SQL_DATA_TYPE. Unmapped combinations fail to compile.
 *
 *     ColumnSchema<MonetDbDialect> id(Column("id"), ColumnType<MonetDbDialect>::of<int64_t>());
 *     fmt::format("{}", id);  // id BIGINT
 */

#include "Identifier.hpp"
#include "SqlFragment.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace sqlquote {

// Maps C++ type T to its SQL type name in Dialect. Specialized per dialect.
template<typename Dialect, typename T>
struct SqlDataType;

#define SQLQUOTE_SQL_DATA_TYPE(DIALECT, TYPE, SQL_TYPE)        \
    template<>                                                 \
    struct SqlDataType<DIALECT, TYPE> {                        \
        static constexpr std::string_view sqlType() {          \
            return SQL_TYPE;                                   \
        }                                                      \
    }

/**
 * @class ColumnType
 * @brief SQL type name of a column in the given dialect.
 *
 * Type names are dialect keywords taken from SqlDataType, not user input,
 * and are rendered verbatim.
 */
template<typename Dialect>
class ColumnType {
public:
    explicit ColumnType(std::string_view name) : m_name(name) {}

    template<typename T>
    static ColumnType of() {
        return ColumnType(SqlDataType<Dialect, T>::sqlType());
    }

    const std::string& str() const { return m_name; }
    std::string toString() const { return m_name; }

    bool operator==(const ColumnType& other) const { return m_name == other.m_name; }
    bool operator!=(const ColumnType& other) const { return m_name != other.m_name; }

private:
    std::string m_name;
};

/// Column name and type, rendered as "<column> <type>".
template<typename Dialect>
class ColumnSchema {
public:
    ColumnSchema(Column column, ColumnType<Dialect> type)
        : m_column(std::move(column)), m_type(std::move(type)) {}

    const Column& column() const { return m_column; }
    const ColumnType<Dialect>& columnType() const { return m_type; }

    std::string toString() const {
        return m_column.toString() + " " + m_type.str();
    }

private:
    Column m_column;
    ColumnType<Dialect> m_type;
};

template<typename Dialect>
std::ostream& operator<<(std::ostream& out, const ColumnType<Dialect>& type) {
    return out << type.str();
}

template<typename Dialect>
std::ostream& operator<<(std::ostream& out, const ColumnSchema<Dialect>& schema) {
    return out << schema.toString();
}

template<typename Dialect>
struct IsSqlFragment<ColumnType<Dialect>> : std::true_type {};

template<typename Dialect>
struct IsSqlFragment<ColumnSchema<Dialect>> : std::true_type {};

}  // namespace sqlquote
