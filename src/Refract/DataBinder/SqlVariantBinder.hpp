// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Api.hpp"
#include "../SqlTraits.hpp"
#include "SqlVariant.hpp"

#include <deque>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// Storage that bound parameters point into. It must outlive the SQLExecute() call.
///
/// Deques never move their elements on growth, so earlier bindings stay valid.
struct SqlBindContext
{
    SqlServerType serverType = SqlServerType::UNKNOWN;
    std::deque<std::string> textBuffers;
    std::deque<SQLLEN> indicators;
};

/// Binds the value as input parameter @p index (1-based) of the prepared statement.
///
/// The value itself is bound by address, so it must also stay alive until SQLExecute().
REFRACT_API SQLRETURN BindParameter(SQLHSTMT stmt, SQLUSMALLINT index, SqlVariant const& value, SqlBindContext& context);

/// Reads column @p column (1-based) of the current row, choosing the alternative by the column's SQL type.
///
/// Text is read in chunks, so values of any length are supported.
REFRACT_API SQLRETURN ReadColumn(SQLHSTMT stmt, SQLUSMALLINT column, SqlVariant& result);
