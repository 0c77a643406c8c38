// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "EntityKey.hpp"

#include <algorithm>
#include <charconv>
#include <functional>

namespace Refract
{

namespace
{

    template <typename T>
    std::optional<T> ParseNumber(std::string_view text) noexcept
    {
        T result {};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if (ec != std::errc() || ptr != text.data() + text.size())
            return std::nullopt;
        return result;
    }

    bool LooksIntegral(std::string_view text) noexcept
    {
        if (text.starts_with('-'))
            text.remove_prefix(1);
        return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
    }

    template <typename... Ts>
    std::optional<EntityKey> ParseFirstOf(std::string_view text)
    {
        auto result = std::optional<EntityKey> {};
        ((result = result ? result : ParseNumber<Ts>(text).transform([](Ts v) { return EntityKey { v }; })), ...);
        return result;
    }

    KeyConversionError ConversionError(EntityKey const& key, FieldType type)
    {
        return KeyConversionError(std::format("Cannot convert key {} to {}", key, type));
    }

} // namespace

EntityKey EntityKey::Parse(std::string_view text)
{
    if (auto key = ParseFirstOf<signed char,
                                short,
                                int,
                                long long,
                                unsigned char,
                                unsigned short,
                                unsigned int,
                                unsigned long long>(text);
        key)
        return std::move(*key);

    // Integer text too large for 64 bits is not narrowed into a floating point key.
    bool const hasDigit = std::ranges::any_of(text, [](char c) { return c >= '0' && c <= '9'; });
    if (hasDigit && !LooksIntegral(text))
    {
        if (auto key = ParseFirstOf<float, double>(text); key)
            return std::move(*key);
    }

    if (text == "true")
        return EntityKey { true };
    if (text == "false")
        return EntityKey { false };

    if (auto const guid = SqlGuid::TryParse(text); guid)
        return EntityKey { *guid };

    return EntityKey { std::string(text) };
}

EntityKey EntityKey::FromSqlVariant(SqlVariant const& value)
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](SqlNullType) -> EntityKey { throw KeyConversionError("Cannot build a key from NULL"); },
        []<typename T>(T const& v) -> EntityKey { return EntityKey { InnerType { v } }; },
    }, value.value);
    // clang-format on
}

SqlVariant EntityKey::ToSqlVariant() const
{
    return std::visit([](auto const& v) { return SqlVariant { SqlVariant::InnerType { v } }; }, m_value);
}

SqlVariant EntityKey::ConvertTo(FieldType type) const
{
    auto const value = ToSqlVariant();

    auto const requireIntegral = [&]<typename T>() -> SqlVariant {
        if (auto const result = value.TryGetIntegral<T>(); result)
            return SqlVariant { *result };
        throw ConversionError(*this, type);
    };

    switch (type)
    {
        case FieldType::Int8:
            return requireIntegral.template operator()<signed char>();
        case FieldType::Int16:
            return requireIntegral.template operator()<short>();
        case FieldType::Int32:
            return requireIntegral.template operator()<int>();
        case FieldType::Int64:
            return requireIntegral.template operator()<long long>();
        case FieldType::UInt8:
            return requireIntegral.template operator()<unsigned char>();
        case FieldType::UInt16:
            return requireIntegral.template operator()<unsigned short>();
        case FieldType::UInt32:
            return requireIntegral.template operator()<unsigned int>();
        case FieldType::UInt64:
            return requireIntegral.template operator()<unsigned long long>();
        case FieldType::Float32:
            if (auto const result = value.TryGetDouble(); result)
                return SqlVariant { static_cast<float>(*result) };
            throw ConversionError(*this, type);
        case FieldType::Float64:
            if (auto const result = value.TryGetDouble(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::String:
            return SqlVariant { ToString() };
        case FieldType::Bool:
            if (auto const result = value.TryGetBool(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::Uuid:
            if (auto const result = value.TryGetGuid(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::Date:
            if (auto const result = value.TryGetDate(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::Time:
            if (auto const result = value.TryGetTime(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::DateTime:
            if (auto const result = value.TryGetDateTime(); result)
                return SqlVariant { *result };
            throw ConversionError(*this, type);
        case FieldType::Json:
        case FieldType::Opaque:
            break;
    }
    return value;
}

std::string EntityKey::ToString() const
{
    return ToSqlVariant().ToString();
}

} // namespace Refract

size_t std::hash<Refract::EntityKey>::operator()(Refract::EntityKey const& key) const noexcept
{
    auto const index = key.Value().index();
    auto const text = key.ToString();
    return std::hash<std::string> {}(text) ^ (std::hash<size_t> {}(index) << 1);
}
