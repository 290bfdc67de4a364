#pragma once

/**
 * @file SqlServerDialect.hpp
 * @brief Column type vocabulary for Microsoft SQL Server.
 */

#include "ColumnType.hpp"
#include <cstdint>
#include <string>

namespace sqlquote {

struct SqlServerDialect {};

SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, bool, "BIT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, int8_t, "TINYINT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, int16_t, "SMALLINT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, int32_t, "INT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, int64_t, "BIGINT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, float, "REAL");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, double, "FLOAT");
SQLQUOTE_SQL_DATA_TYPE(SqlServerDialect, std::string, "NVARCHAR");

}  // namespace sqlquote
