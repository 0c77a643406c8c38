// SPDX-License-Identifier: Apache-2.0

#include "SqlVariant.hpp"

bool SqlVariant::IsIntegral() const noexcept
{
    return std::visit(
        []<typename T>(T const&) { return std::is_integral_v<T> && !std::same_as<T, bool>; }, value);
}

std::optional<bool> SqlVariant::TryGetBool() const noexcept
{
    if (auto const* flag = std::get_if<bool>(&value))
        return *flag;

    if (auto const text = TryGetStringView(); text)
    {
        if (*text == "true" || *text == "1")
            return true;
        if (*text == "false" || *text == "0")
            return false;
        return std::nullopt;
    }

    if (!IsIntegral())
        return std::nullopt;

    switch (TryGetIntegral<int>().value_or(-1))
    {
        case 0:
            return false;
        case 1:
            return true;
        default:
            return std::nullopt;
    }
}

std::optional<double> SqlVariant::TryGetDouble() const noexcept
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](bool) -> std::optional<double> { return std::nullopt; },
        []<typename V>(V const& v) -> std::optional<double> requires std::is_arithmetic_v<V> {
            return static_cast<double>(v);
        },
        [](std::string const& text) -> std::optional<double> {
            double result {};
            auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
            if (text.empty() || ec != std::errc() || ptr != text.data() + text.size())
                return std::nullopt;
            return result;
        },
        [](auto const&) -> std::optional<double> { return std::nullopt; },
    }, value);
    // clang-format on
}

std::optional<SqlDate> SqlVariant::TryGetDate() const noexcept
{
    if (auto const* date = std::get_if<SqlDate>(&value))
        return *date;
    // Some drivers report DATE columns as timestamps.
    if (auto const* dateTime = std::get_if<SqlDateTime>(&value))
        return dateTime->Date();
    if (auto const text = TryGetStringView(); text)
        return SqlDate::TryParse(*text);
    return std::nullopt;
}

std::optional<SqlTime> SqlVariant::TryGetTime() const noexcept
{
    if (auto const* time = std::get_if<SqlTime>(&value))
        return *time;
    if (auto const text = TryGetStringView(); text)
        return SqlTime::TryParse(*text);
    return std::nullopt;
}

std::optional<SqlDateTime> SqlVariant::TryGetDateTime() const noexcept
{
    if (auto const* dateTime = std::get_if<SqlDateTime>(&value))
        return *dateTime;
    if (auto const* date = std::get_if<SqlDate>(&value))
        return SqlDateTime { *date, SqlTime {} };
    if (auto const text = TryGetStringView(); text)
        return SqlDateTime::TryParse(*text);
    return std::nullopt;
}

std::optional<SqlGuid> SqlVariant::TryGetGuid() const noexcept
{
    if (auto const* guid = std::get_if<SqlGuid>(&value))
        return *guid;
    if (auto const text = TryGetStringView(); text)
        return SqlGuid::TryParse(*text);
    return std::nullopt;
}

std::string SqlVariant::ToString() const
{
    using namespace std::string_literals;

    // clang-format off
    return std::visit(detail::overloaded {
        [](SqlNullType) { return "NULL"s; },
        [](bool v) { return v ? "true"s : "false"s; },
        [](std::string const& v) { return v; },
        [](auto const& v) { return std::format("{}", v); },
    }, value);
    // clang-format on
}
