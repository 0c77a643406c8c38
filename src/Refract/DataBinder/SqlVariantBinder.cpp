// SPDX-License-Identifier: Apache-2.0

#include "../SqlLogger.hpp"
#include "SqlVariantBinder.hpp"

#include <algorithm>
#include <array>
#include <format>

#if !defined(SQL_SS_TIME2)
    #define SQL_SS_TIME2 (-154)
#endif

namespace
{

template <typename Native, typename Convert>
SQLRETURN ReadFixed(SQLHSTMT stmt, SQLUSMALLINT column, SQLSMALLINT cType, SqlVariant& result, Convert convert)
{
    Native native {};
    SQLLEN indicator {};
    auto const returnCode = SQLGetData(stmt, column, cType, &native, sizeof(native), &indicator);
    if (SQL_SUCCEEDED(returnCode))
        result = indicator == SQL_NULL_DATA ? SqlVariant { SqlNullValue } : SqlVariant { convert(native) };
    return returnCode;
}

template <typename T>
SQLRETURN ReadFixed(SQLHSTMT stmt, SQLUSMALLINT column, SQLSMALLINT cType, SqlVariant& result)
{
    return ReadFixed<T>(stmt, column, cType, result, [](T value) { return value; });
}

SQLRETURN ReadText(SQLHSTMT stmt, SQLUSMALLINT column, SqlVariant& result)
{
    auto text = std::string {};
    auto chunk = std::array<char, 1024> {};
    while (true)
    {
        SQLLEN indicator {};
        auto const returnCode = SQLGetData(stmt, column, SQL_C_CHAR, chunk.data(), (SQLLEN) chunk.size(), &indicator);
        if (returnCode == SQL_NO_DATA)
            break;
        if (!SQL_SUCCEEDED(returnCode))
            return returnCode;
        if (indicator == SQL_NULL_DATA)
        {
            result = SqlVariant { SqlNullValue };
            return returnCode;
        }

        // A filled chunk ends with the null terminator.
        auto const filled = indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(chunk.size());
        text.append(chunk.data(), filled ? chunk.size() - 1 : static_cast<size_t>(indicator));
        if (!filled)
            break;
    }
    result = SqlVariant { std::move(text) };
    return SQL_SUCCESS;
}

} // namespace

SQLRETURN BindParameter(SQLHSTMT stmt, SQLUSMALLINT index, SqlVariant const& value, SqlBindContext& context)
{
    auto const bind = [&](SQLSMALLINT cType,
                          SQLSMALLINT sqlType,
                          SQLULEN columnSize,
                          SQLSMALLINT decimalDigits,
                          void const* data,
                          SQLLEN bufferLength = 0,
                          SQLLEN* indicator = nullptr) {
        return SQLBindParameter(stmt,
                                index,
                                SQL_PARAM_INPUT,
                                cType,
                                sqlType,
                                columnSize,
                                decimalDigits,
                                const_cast<void*>(data), // NOLINT(cppcoreguidelines-pro-type-const-cast)
                                bufferLength,
                                indicator);
    };

    auto const bindText = [&](std::string const& text) {
        auto& length = context.indicators.emplace_back(static_cast<SQLLEN>(text.size()));
        return bind(SQL_C_CHAR, SQL_VARCHAR, (std::max)(text.size(), size_t { 1 }), 0, text.data(), length, &length);
    };

    // clang-format off
    return std::visit(detail::overloaded {
        [&](SqlNullType) {
            auto& indicator = context.indicators.emplace_back(SQL_NULL_DATA);
            return bind(SQL_C_CHAR, SQL_VARCHAR, 10, 0, nullptr, 0, &indicator);
        },
        [&](bool const& v) { return bind(SQL_C_BIT, SQL_BIT, 1, 0, &v); },
        [&](signed char const& v) { return bind(SQL_C_STINYINT, SQL_TINYINT, 0, 0, &v); },
        [&](unsigned char const& v) { return bind(SQL_C_UTINYINT, SQL_TINYINT, 0, 0, &v); },
        [&](short const& v) { return bind(SQL_C_SSHORT, SQL_SMALLINT, 0, 0, &v); },
        [&](unsigned short const& v) { return bind(SQL_C_USHORT, SQL_INTEGER, 0, 0, &v); },
        [&](int const& v) { return bind(SQL_C_SLONG, SQL_INTEGER, 0, 0, &v); },
        [&](unsigned int const& v) { return bind(SQL_C_ULONG, SQL_BIGINT, 0, 0, &v); },
        [&](long long const& v) { return bind(SQL_C_SBIGINT, SQL_BIGINT, 0, 0, &v); },
        [&](unsigned long long const& v) { return bind(SQL_C_UBIGINT, SQL_BIGINT, 0, 0, &v); },
        [&](float const& v) { return bind(SQL_C_FLOAT, SQL_REAL, 0, 0, &v); },
        [&](double const& v) { return bind(SQL_C_DOUBLE, SQL_DOUBLE, 0, 0, &v); },
        [&](std::string const& v) { return bindText(v); },
        [&](SqlDate const& v) { return bind(SQL_C_TYPE_DATE, SQL_TYPE_DATE, 10, 0, &v.sqlValue); },
        [&](SqlTime const& v) { return bind(SQL_C_TYPE_TIME, SQL_TYPE_TIME, 8, 0, &v.sqlValue); },
        [&](SqlDateTime const& v) { return bind(SQL_C_TYPE_TIMESTAMP, SQL_TYPE_TIMESTAMP, 27, 7, &v.sqlValue); },
        [&](SqlGuid const& v) {
            // SQLite has no UUID type; they are stored as their text form.
            if (context.serverType == SqlServerType::SQLITE || context.serverType == SqlServerType::UNKNOWN)
                return bindText(context.textBuffers.emplace_back(std::format("{}", v)));
            return bind(SQL_C_GUID, SQL_GUID, v.data.size(), 0, v.data.data());
        },
    }, value.value);
    // clang-format on
}

SQLRETURN ReadColumn(SQLHSTMT stmt, SQLUSMALLINT column, SqlVariant& result)
{
    SQLLEN columnType {};
    auto const returnCode =
        SQLColAttributeA(stmt, column, SQL_DESC_CONCISE_TYPE, nullptr, 0, nullptr, &columnType);
    if (!SQL_SUCCEEDED(returnCode))
        return returnCode;

    switch (columnType)
    {
        case SQL_BIT:
            return ReadFixed<unsigned char>(stmt, column, SQL_C_BIT, result, [](unsigned char v) { return v != 0; });
        case SQL_TINYINT:
        case SQL_SMALLINT:
            return ReadFixed<short>(stmt, column, SQL_C_SSHORT, result);
        case SQL_INTEGER:
            return ReadFixed<int>(stmt, column, SQL_C_SLONG, result);
        case SQL_BIGINT:
            return ReadFixed<long long>(stmt, column, SQL_C_SBIGINT, result);
        case SQL_REAL:
            return ReadFixed<float>(stmt, column, SQL_C_FLOAT, result);
        case SQL_FLOAT:
        case SQL_DOUBLE:
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            return ReadFixed<double>(stmt, column, SQL_C_DOUBLE, result);
        case SQL_CHAR:
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR:
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            // The driver converts wide and binary data into SQL_C_CHAR.
            return ReadText(stmt, column, result);
        case SQL_TYPE_DATE:
            return ReadFixed<SQL_DATE_STRUCT>(
                stmt, column, SQL_C_TYPE_DATE, result, [](SQL_DATE_STRUCT const& v) { return SqlDate { v }; });
        case SQL_TYPE_TIME:
            return ReadFixed<SQL_TIME_STRUCT>(
                stmt, column, SQL_C_TYPE_TIME, result, [](SQL_TIME_STRUCT const& v) { return SqlTime { v }; });
        case SQL_SS_TIME2: {
            // SQL Server TIME carries fractional seconds, which SqlTime does not keep.
            auto const readResult = ReadText(stmt, column, result);
            if (SQL_SUCCEEDED(readResult) && !result.IsNull())
                result = SqlVariant { SqlTime::TryParse(result.Get<std::string>().substr(0, 8)) };
            return readResult;
        }
        case SQL_DATETIME: // Oracle reports DATE columns this way.
        case SQL_TYPE_TIMESTAMP:
            return ReadFixed<SQL_TIMESTAMP_STRUCT>(stmt,
                                                   column,
                                                   SQL_C_TYPE_TIMESTAMP,
                                                   result,
                                                   [](SQL_TIMESTAMP_STRUCT const& v) { return SqlDateTime { v }; });
        case SQL_GUID:
            return ReadFixed<SqlGuid>(stmt, column, SQL_C_GUID, result);
        case SQL_TYPE_NULL:
            result = SqlVariant { SqlNullValue };
            return SQL_SUCCESS;
        default:
            SqlLogger::GetLogger().OnWarning(std::format("Column {} has the unsupported SQL type {}", column, columnType));
            return SQL_ERROR;
    }
}
