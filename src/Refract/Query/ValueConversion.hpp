// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "../Error.hpp"
#include "../Schema/Entity.hpp"

#include <concepts>
#include <format>
#include <optional>
#include <string>
#include <type_traits>

namespace Refract
{

/// Converts a value read from the database into the representation of the given field type.
///
/// Drivers report columns in their own storage types (e.g. SQLite stores booleans as integers).
/// NULL is passed through. Returns std::nullopt if the value cannot be represented.
[[nodiscard]] REFRACT_API std::optional<SqlVariant> TryConvertValue(SqlVariant const& value, FieldType type);

/// Same as TryConvertValue(), but throws KeyConversionError if the value cannot be represented.
[[nodiscard]] REFRACT_API SqlVariant ConvertValue(SqlVariant const& value, FieldType type);

/// Converts a value read from the database into its field type, keeping the driver's value if that fails.
[[nodiscard]] REFRACT_API SqlVariant NormalizeValue(SqlVariant value, FieldType type);

/// Maps a user-defined field type to and from SqlVariant.
///
/// Specialize this for types the generated entity structs use beyond the built-in ones:
///
/// @code
/// template <>
/// struct Refract::ValueConverter<Money>
/// {
///     static SqlVariant ToSql(Money const& value) { return value.cents; }
///     static Money FromSql(SqlVariant const& value) { return Money { value.TryGetIntegral<long long>().value_or(0) }; }
/// };
/// @endcode
template <typename T>
struct ValueConverter;

namespace detail_value
{
    template <typename T>
    concept HasValueConverter = requires(T const& value, SqlVariant const& variant) {
        { ValueConverter<T>::ToSql(value) } -> std::convertible_to<SqlVariant>;
        { ValueConverter<T>::FromSql(variant) } -> std::convertible_to<T>;
    };

    template <typename T>
    struct IsOptional: std::false_type
    {
    };

    template <typename T>
    struct IsOptional<std::optional<T>>: std::true_type
    {
    };

    template <typename T>
    [[noreturn]] void ThrowNotConvertible(SqlVariant const& value)
    {
        throw KeyConversionError(std::format("Cannot convert value {} to the requested field type", value));
    }
} // namespace detail_value

template <typename T>
[[nodiscard]] SqlVariant ToSqlValue(T const& value)
{
    if constexpr (detail_value::IsOptional<T>::value)
    {
        if (!value)
            return SqlVariant { SqlNullValue };
        return ToSqlValue(*value);
    }
    else if constexpr (detail_value::HasValueConverter<T>)
        return ValueConverter<T>::ToSql(value);
    else
        return SqlVariant { value };
}

template <typename T>
[[nodiscard]] T FromSqlValue(SqlVariant const& value)
{
    if constexpr (detail_value::IsOptional<T>::value)
    {
        if (value.IsNull())
            return std::nullopt;
        return FromSqlValue<typename T::value_type>(value);
    }
    else if constexpr (detail_value::HasValueConverter<T>)
        return ValueConverter<T>::FromSql(value);
    else if constexpr (std::same_as<T, bool>)
    {
        if (auto const result = value.TryGetBool(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::is_integral_v<T>)
    {
        if (auto const result = value.TryGetIntegral<T>(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        if (auto const result = value.TryGetDouble(); result)
            return static_cast<T>(*result);
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::same_as<T, std::string>)
    {
        if (auto const text = value.TryGetStringView(); text)
            return std::string(*text);
        if (value.IsNull())
            detail_value::ThrowNotConvertible<T>(value);
        return value.ToString();
    }
    else if constexpr (std::same_as<T, SqlGuid>)
    {
        if (auto const result = value.TryGetGuid(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::same_as<T, SqlDate>)
    {
        if (auto const result = value.TryGetDate(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::same_as<T, SqlTime>)
    {
        if (auto const result = value.TryGetTime(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else if constexpr (std::same_as<T, SqlDateTime>)
    {
        if (auto const result = value.TryGetDateTime(); result)
            return *result;
        detail_value::ThrowNotConvertible<T>(value);
    }
    else
        static_assert(detail_value::HasValueConverter<T>, "No conversion from SqlVariant; specialize ValueConverter");
}

} // namespace Refract
