// SPDX-License-Identifier: Apache-2.0

#include "SqlChrono.hpp"

#include <charconv>

namespace
{

// Reads exactly text.size() decimal digits.
template <typename T>
bool ReadDigits(std::string_view text, T& result) noexcept
{
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    return ec == std::errc() && ptr == text.data() + text.size() && !text.starts_with('-') && !text.starts_with('+');
}

} // namespace

std::optional<SqlDate> SqlDate::TryParse(std::string_view text) noexcept
{
    int year {};
    unsigned month {};
    unsigned day {};
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;
    if (!ReadDigits(text.substr(0, 4), year) || !ReadDigits(text.substr(5, 2), month)
        || !ReadDigits(text.substr(8, 2), day))
        return std::nullopt;

    auto const date = std::chrono::year_month_day { std::chrono::year { year }, std::chrono::month { month }, std::chrono::day { day } };
    if (!date.ok())
        return std::nullopt;
    return SqlDate { date };
}

std::optional<SqlTime> SqlTime::TryParse(std::string_view text) noexcept
{
    unsigned hour {};
    unsigned minute {};
    unsigned second {};
    if (text.size() != 8 || text[2] != ':' || text[5] != ':')
        return std::nullopt;
    if (!ReadDigits(text.substr(0, 2), hour) || !ReadDigits(text.substr(3, 2), minute)
        || !ReadDigits(text.substr(6, 2), second))
        return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59)
        return std::nullopt;

    return SqlTime { std::chrono::hours { hour }, std::chrono::minutes { minute }, std::chrono::seconds { second } };
}

SqlDateTime::SqlDateTime(native_type timePoint) noexcept
{
    using namespace std::chrono;
    auto const day = floor<days>(timePoint);
    auto const time = hh_mm_ss { floor<seconds>(timePoint - day) };
    *this = SqlDateTime { SqlDate { year_month_day { day } },
                          SqlTime { time.hours(), time.minutes(), time.seconds() },
                          timePoint - floor<seconds>(timePoint) };
}

std::optional<SqlDateTime> SqlDateTime::TryParse(std::string_view text) noexcept
{
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T'))
        return std::nullopt;

    auto const date = SqlDate::TryParse(text.substr(0, 10));
    auto const time = SqlTime::TryParse(text.substr(11, 8));
    if (!date || !time)
        return std::nullopt;

    auto fraction = std::chrono::nanoseconds {};
    if (auto digits = text.substr(19); !digits.empty())
    {
        digits.remove_prefix(1);
        unsigned value {};
        if (text[19] != '.' || digits.empty() || digits.size() > 9 || !ReadDigits(digits, value))
            return std::nullopt;
        for (auto i = digits.size(); i < 9; ++i)
            value *= 10;
        fraction = std::chrono::nanoseconds { value };
    }

    return SqlDateTime { *date, *time, fraction };
}
