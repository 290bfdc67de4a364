#pragma once

/**
 * @file MonetDbDialect.hpp
 * @brief Column type vocabulary for MonetDB.
 *
 * MonetDB has no single precision float mapping here; float columns should
 * be widened to double by the caller.
 */

#include "ColumnType.hpp"
#include <cstdint>
#include <string>

namespace sqlquote {

struct MonetDbDialect {};

SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, bool, "BOOLEAN");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, int8_t, "TINYINT");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, int16_t, "SMALLINT");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, int32_t, "INT");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, int64_t, "BIGINT");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, double, "DOUBLE");
SQLQUOTE_SQL_DATA_TYPE(MonetDbDialect, std::string, "STRING");

}  // namespace sqlquote
