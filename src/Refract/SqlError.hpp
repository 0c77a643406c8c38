// SPDX-License-Identifier: Apache-2.0
#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// First diagnostic record of a failed ODBC call.
struct SqlErrorInfo
{
    SQLINTEGER nativeErrorCode {};
    std::string sqlState;
    std::string message;

    REFRACT_API static SqlErrorInfo fromHandle(SQLSMALLINT handleType, SQLHANDLE handle);

    static SqlErrorInfo fromConnectionHandle(SQLHDBC hDbc)
    {
        return fromHandle(SQL_HANDLE_DBC, hDbc);
    }

    static SqlErrorInfo fromStatementHandle(SQLHSTMT hStmt)
    {
        return fromHandle(SQL_HANDLE_STMT, hStmt);
    }
};

/// Raised for every failed ODBC call. Backend errors (constraint violations, lost connections)
/// reach the caller through this type unmodified.
class REFRACT_API SqlException: public std::runtime_error
{
  public:
    explicit SqlException(SqlErrorInfo info, std::source_location location = std::source_location::current());

    [[nodiscard]] SqlErrorInfo const& info() const noexcept
    {
        return _info;
    }

  private:
    SqlErrorInfo _info;
};

template <>
struct std::formatter<SqlErrorInfo>: formatter<std::string>
{
    auto format(SqlErrorInfo const& info, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            std::format("{} ({}) - {}", info.sqlState, info.nativeErrorCode, info.message), ctx);
    }
};
