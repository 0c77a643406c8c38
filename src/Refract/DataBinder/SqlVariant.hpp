// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Utils.hpp"
#include "SqlChrono.hpp"
#include "SqlGuid.hpp"

#include <charconv>
#include <concepts>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

/// The SQL NULL value.
struct SqlNullType
{
    constexpr bool operator==(SqlNullType const& /*other*/) const noexcept = default;
};

constexpr auto SqlNullValue = SqlNullType {};

/// A column or parameter value whose type is only known at runtime.
///
/// Every value that crosses the database boundary is carried in one: parameters are bound from
/// it, columns are read into it, and records, conditions and keys are made of it.
struct SqlVariant
{
    using InnerType = std::variant<SqlNullType,
                                   bool,
                                   signed char,
                                   unsigned char,
                                   short,
                                   unsigned short,
                                   int,
                                   unsigned int,
                                   long long,
                                   unsigned long long,
                                   float,
                                   double,
                                   std::string,
                                   SqlDate,
                                   SqlTime,
                                   SqlDateTime,
                                   SqlGuid>;

    InnerType value;

    SqlVariant() = default;

    SqlVariant(InnerType other) noexcept:
        value(std::move(other))
    {
    }

    template <typename T>
        requires(std::constructible_from<InnerType, T> && !std::same_as<std::remove_cvref_t<T>, SqlVariant>
                 && !std::same_as<std::remove_cvref_t<T>, InnerType> && !std::same_as<std::remove_cvref_t<T>, long>
                 && !std::same_as<std::remove_cvref_t<T>, unsigned long>
                 && !std::is_convertible_v<T, std::string_view>)
    SqlVariant(T&& other):
        value(std::forward<T>(other))
    {
    }

    // int64_t and uint64_t are long on LP64 platforms, and no alternative of their own.
    SqlVariant(long other) noexcept:
        value(static_cast<long long>(other))
    {
    }

    SqlVariant(unsigned long other) noexcept:
        value(static_cast<unsigned long long>(other))
    {
    }

    SqlVariant(std::string_view text):
        value(std::string(text))
    {
    }

    SqlVariant(std::string text) noexcept:
        value(std::move(text))
    {
    }

    SqlVariant(char const* text):
        value(std::string(text))
    {
    }

    template <typename T>
    SqlVariant(std::optional<T> const& other):
        SqlVariant { other ? SqlVariant { *other } : SqlVariant { SqlNullValue } }
    {
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return std::holds_alternative<SqlNullType>(value);
    }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    [[nodiscard]] T const& Get() const
    {
        return std::get<T>(value);
    }

    /// True for every integer alternative except bool.
    [[nodiscard]] REFRACT_API bool IsIntegral() const noexcept;

    [[nodiscard]] bool IsFloatingPoint() const noexcept
    {
        return Is<float>() || Is<double>();
    }

    /// Converts an integer, a whole floating point number, or integer text into T if it fits.
    template <typename T>
        requires std::is_integral_v<T>
    [[nodiscard]] std::optional<T> TryGetIntegral() const noexcept;

    /// Accepts bool, 0 and 1, and the texts "true", "false", "1" and "0".
    [[nodiscard]] REFRACT_API std::optional<bool> TryGetBool() const noexcept;

    /// Accepts any number except bool, and numeric text.
    [[nodiscard]] REFRACT_API std::optional<double> TryGetDouble() const noexcept;

    [[nodiscard]] std::optional<std::string_view> TryGetStringView() const noexcept
    {
        if (auto const* text = std::get_if<std::string>(&value))
            return std::string_view { *text };
        return std::nullopt;
    }

    // The temporal and UUID accessors also parse their canonical text forms.
    [[nodiscard]] REFRACT_API std::optional<SqlDate> TryGetDate() const noexcept;
    [[nodiscard]] REFRACT_API std::optional<SqlTime> TryGetTime() const noexcept;
    [[nodiscard]] REFRACT_API std::optional<SqlDateTime> TryGetDateTime() const noexcept;
    [[nodiscard]] REFRACT_API std::optional<SqlGuid> TryGetGuid() const noexcept;

    /// Converts a non-NULL value into T with the TryGet* accessor matching T.
    ///
    /// Any non-NULL value converts into its text when T is std::string.
    template <typename T>
    [[nodiscard]] std::optional<T> TryGetAs() const;

    bool operator==(SqlVariant const& other) const noexcept = default;

    [[nodiscard]] REFRACT_API std::string ToString() const;
};

template <typename T>
    requires std::is_integral_v<T>
std::optional<T> SqlVariant::TryGetIntegral() const noexcept
{
    if constexpr (std::same_as<T, bool>)
        return TryGetBool();
    else
    {
        // clang-format off
        return std::visit(detail::overloaded {
            [](bool) -> std::optional<T> { return std::nullopt; },
            []<typename V>(V const& v) -> std::optional<T> requires std::is_integral_v<V> {
                return std::in_range<T>(v) ? std::optional<T> { static_cast<T>(v) } : std::nullopt;
            },
            []<typename V>(V const& v) -> std::optional<T> requires std::is_floating_point_v<V> {
                // The bounds are exact doubles; anything outside cannot fit into 64 bits.
                if (!(v >= -0x1p63 && v < 0x1p63) || static_cast<V>(static_cast<long long>(v)) != v)
                    return std::nullopt;
                auto const whole = static_cast<long long>(v);
                return std::in_range<T>(whole) ? std::optional<T> { static_cast<T>(whole) } : std::nullopt;
            },
            [](std::string const& text) -> std::optional<T> {
                T result {};
                auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
                if (ec != std::errc() || ptr != text.data() + text.size())
                    return std::nullopt;
                return result;
            },
            [](auto const&) -> std::optional<T> { return std::nullopt; },
        }, value);
        // clang-format on
    }
}

template <typename T>
std::optional<T> SqlVariant::TryGetAs() const
{
    if (IsNull())
        return std::nullopt;

    if constexpr (std::same_as<T, SqlVariant>)
        return *this;
    else if constexpr (std::same_as<T, std::string>)
        return ToString();
    else if constexpr (std::is_integral_v<T>)
        return TryGetIntegral<T>();
    else if constexpr (std::is_floating_point_v<T>)
        return TryGetDouble().transform([](double v) { return static_cast<T>(v); });
    else if constexpr (std::same_as<T, SqlDate>)
        return TryGetDate();
    else if constexpr (std::same_as<T, SqlTime>)
        return TryGetTime();
    else if constexpr (std::same_as<T, SqlDateTime>)
        return TryGetDateTime();
    else if constexpr (std::same_as<T, SqlGuid>)
        return TryGetGuid();
    else
        static_assert(detail::AlwaysFalse<T>, "No conversion from SqlVariant");
}

template <>
struct std::formatter<SqlVariant>: formatter<string>
{
    auto format(SqlVariant const& value, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(value.ToString(), ctx);
    }
};
