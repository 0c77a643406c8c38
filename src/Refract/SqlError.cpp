// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <algorithm>

SqlErrorInfo SqlErrorInfo::fromHandle(SQLSMALLINT handleType, SQLHANDLE handle)
{
    SQLCHAR state[SQL_SQLSTATE_SIZE + 1] {};
    SQLCHAR text[SQL_MAX_MESSAGE_LENGTH] {};
    SQLSMALLINT textLength {};

    auto info = SqlErrorInfo {};
    auto const result = SQLGetDiagRecA(
        handleType, handle, 1, state, &info.nativeErrorCode, text, static_cast<SQLSMALLINT>(sizeof(text)), &textLength);
    if (!SQL_SUCCEEDED(result))
    {
        info.sqlState = "HY000";
        info.message = "No diagnostic record available";
        return info;
    }

    info.sqlState = reinterpret_cast<char const*>(state);
    info.message.assign(reinterpret_cast<char const*>(text),
                        std::clamp<size_t>(static_cast<size_t>(textLength), 0, sizeof(text) - 1));
    return info;
}

SqlException::SqlException(SqlErrorInfo info, std::source_location location):
    std::runtime_error(std::format("{}", info)),
    _info { std::move(info) }
{
    SqlLogger::GetLogger().OnError(_info, location);
}
