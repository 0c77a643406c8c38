// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Api.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqltypes.h>

/// Calendar date of a DATE column, in the layout SQLGetData() writes for SQL_C_TYPE_DATE.
struct SqlDate
{
    SQL_DATE_STRUCT sqlValue {};

    constexpr SqlDate() noexcept = default;

    explicit constexpr SqlDate(SQL_DATE_STRUCT value) noexcept:
        sqlValue { value }
    {
    }

    constexpr SqlDate(std::chrono::year_month_day date) noexcept:
        sqlValue { .year = static_cast<SQLSMALLINT>(static_cast<int>(date.year())),
                   .month = static_cast<SQLUSMALLINT>(static_cast<unsigned>(date.month())),
                   .day = static_cast<SQLUSMALLINT>(static_cast<unsigned>(date.day())) }
    {
    }

    constexpr SqlDate(std::chrono::year year, std::chrono::month month, std::chrono::day day) noexcept:
        SqlDate(std::chrono::year_month_day { year, month, day })
    {
    }

    [[nodiscard]] constexpr std::chrono::year_month_day value() const noexcept
    {
        return { std::chrono::year { sqlValue.year }, std::chrono::month { sqlValue.month }, std::chrono::day { sqlValue.day } };
    }

    constexpr bool operator==(SqlDate const& other) const noexcept
    {
        return value() == other.value();
    }

    /// Parses YYYY-MM-DD, rejecting dates that do not exist.
    REFRACT_API static std::optional<SqlDate> TryParse(std::string_view text) noexcept;
};

/// Time of day of a TIME column, with whole-second precision.
struct SqlTime
{
    SQL_TIME_STRUCT sqlValue {};

    constexpr SqlTime() noexcept = default;

    explicit constexpr SqlTime(SQL_TIME_STRUCT value) noexcept:
        sqlValue { value }
    {
    }

    constexpr SqlTime(std::chrono::hours hour, std::chrono::minutes minute, std::chrono::seconds second) noexcept:
        sqlValue { .hour = static_cast<SQLUSMALLINT>(hour.count()),
                   .minute = static_cast<SQLUSMALLINT>(minute.count()),
                   .second = static_cast<SQLUSMALLINT>(second.count()) }
    {
    }

    [[nodiscard]] constexpr std::chrono::seconds value() const noexcept
    {
        return std::chrono::hours { sqlValue.hour } + std::chrono::minutes { sqlValue.minute }
               + std::chrono::seconds { sqlValue.second };
    }

    constexpr bool operator==(SqlTime const& other) const noexcept
    {
        return value() == other.value();
    }

    /// Parses HH:MM:SS on a 24 hour clock.
    REFRACT_API static std::optional<SqlTime> TryParse(std::string_view text) noexcept;
};

/// Point in time of a TIMESTAMP or DATETIME column, with 100ns precision.
struct SqlDateTime
{
    using native_type = std::chrono::sys_time<std::chrono::nanoseconds>;

    SQL_TIMESTAMP_STRUCT sqlValue {};

    constexpr SqlDateTime() noexcept = default;

    explicit constexpr SqlDateTime(SQL_TIMESTAMP_STRUCT value) noexcept:
        sqlValue { value }
    {
    }

    constexpr SqlDateTime(SqlDate date, SqlTime time, std::chrono::nanoseconds fraction = {}) noexcept:
        sqlValue { .year = date.sqlValue.year,
                   .month = date.sqlValue.month,
                   .day = date.sqlValue.day,
                   .hour = time.sqlValue.hour,
                   .minute = time.sqlValue.minute,
                   .second = time.sqlValue.second,
                   .fraction = static_cast<SQLUINTEGER>(fraction.count() / 100 * 100) }
    {
    }

    REFRACT_API SqlDateTime(native_type timePoint) noexcept;

    static SqlDateTime Now() noexcept
    {
        return SqlDateTime { std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now()) };
    }

    [[nodiscard]] constexpr SqlDate Date() const noexcept
    {
        return SqlDate { std::chrono::year { sqlValue.year },
                         std::chrono::month { sqlValue.month },
                         std::chrono::day { sqlValue.day } };
    }

    [[nodiscard]] constexpr SqlTime Time() const noexcept
    {
        return SqlTime { std::chrono::hours { sqlValue.hour },
                         std::chrono::minutes { sqlValue.minute },
                         std::chrono::seconds { sqlValue.second } };
    }

    [[nodiscard]] constexpr native_type value() const noexcept
    {
        return std::chrono::sys_days { Date().value() } + Time().value() + std::chrono::nanoseconds { sqlValue.fraction };
    }

    constexpr bool operator==(SqlDateTime const& other) const noexcept
    {
        return value() == other.value();
    }

    /// Parses "YYYY-MM-DD HH:MM:SS" (or with a 'T' separator), with up to nine optional fraction digits.
    REFRACT_API static std::optional<SqlDateTime> TryParse(std::string_view text) noexcept;
};

template <>
struct std::formatter<SqlDate>: std::formatter<std::string>
{
    auto format(SqlDate const& date, format_context& ctx) const -> format_context::iterator
    {
        auto const& v = date.sqlValue;
        return std::formatter<std::string>::format(std::format("{:04}-{:02}-{:02}", v.year, v.month, v.day), ctx);
    }
};

template <>
struct std::formatter<SqlTime>: std::formatter<std::string>
{
    auto format(SqlTime const& time, format_context& ctx) const -> format_context::iterator
    {
        auto const& v = time.sqlValue;
        return std::formatter<std::string>::format(std::format("{:02}:{:02}:{:02}", v.hour, v.minute, v.second), ctx);
    }
};

template <>
struct std::formatter<SqlDateTime>: std::formatter<std::string>
{
    auto format(SqlDateTime const& dateTime, format_context& ctx) const -> format_context::iterator
    {
        auto text = std::format("{} {}", dateTime.Date(), dateTime.Time());
        if (dateTime.sqlValue.fraction != 0)
            text += std::format(".{:09}", dateTime.sqlValue.fraction);
        return std::formatter<std::string>::format(text, ctx);
    }
};
