// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "../Schema/Entity.hpp"

#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Refract
{

/// A primary or foreign key value whose concrete type is only known at runtime.
///
/// Keys cross entity boundaries: a relation knows that it points at another entity's key, but
/// generated code for one entity does not know the key type of another. The key is converted
/// into the type a column expects through ConvertTo() or the KeyTypeRegistry.
class REFRACT_API EntityKey
{
  public:
    using InnerType = std::variant<signed char,
                                   short,
                                   int,
                                   long long,
                                   unsigned char,
                                   unsigned short,
                                   unsigned int,
                                   unsigned long long,
                                   float,
                                   double,
                                   bool,
                                   std::string,
                                   SqlGuid,
                                   SqlDate,
                                   SqlTime,
                                   SqlDateTime>;

    EntityKey() = default;
    EntityKey(EntityKey const&) = default;
    EntityKey(EntityKey&&) noexcept = default;
    EntityKey& operator=(EntityKey const&) = default;
    EntityKey& operator=(EntityKey&&) noexcept = default;
    ~EntityKey() = default;

    template <typename T>
        requires(std::constructible_from<InnerType, T> && !std::same_as<std::remove_cvref_t<T>, EntityKey>
                 && !std::same_as<std::remove_cvref_t<T>, long> && !std::same_as<std::remove_cvref_t<T>, unsigned long>
                 && !std::same_as<std::remove_cvref_t<T>, char const*> && !std::same_as<std::remove_cvref_t<T>, char>)
    EntityKey(T&& value):
        m_value(std::forward<T>(value))
    {
    }

    // int64_t and uint64_t are long on LP64 platforms.
    EntityKey(long value) noexcept:
        m_value(static_cast<long long>(value))
    {
    }

    EntityKey(unsigned long value) noexcept:
        m_value(static_cast<unsigned long long>(value))
    {
    }

    EntityKey(char const* text):
        m_value(std::string(text))
    {
    }

    EntityKey(std::string_view text):
        m_value(std::string(text))
    {
    }

    /// Infers the key type from its textual form.
    ///
    /// Tries each integer width from 8 to 64 bits (signed, then unsigned), each floating point width,
    /// a boolean, a UUID, and falls back to a string. Integer text that fits no integer width stays a string.
    [[nodiscard]] static EntityKey Parse(std::string_view text);

    /// Reconstructs a key from a value read from or bound to the database.
    ///
    /// @throws KeyConversionError if the value is NULL.
    [[nodiscard]] static EntityKey FromSqlVariant(SqlVariant const& value);

    /// Converts the key into the value bound to a statement, preserving its type.
    [[nodiscard]] SqlVariant ToSqlVariant() const;

    /// Converts the key into a value of the given field type.
    ///
    /// @throws KeyConversionError if the key cannot be represented in that type.
    [[nodiscard]] SqlVariant ConvertTo(FieldType type) const;

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] InnerType const& Value() const noexcept
    {
        return m_value;
    }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept
    {
        return std::holds_alternative<T>(m_value);
    }

    template <typename T>
    [[nodiscard]] std::optional<T> TryGet() const noexcept
    {
        if (auto const* value = std::get_if<T>(&m_value))
            return *value;
        return std::nullopt;
    }

    /// Retrieves the key as the given integral type, if it is integral and in range.
    template <typename T>
        requires std::is_integral_v<T>
    [[nodiscard]] std::optional<T> TryGetIntegral() const noexcept
    {
        return ToSqlVariant().TryGetIntegral<T>();
    }

    bool operator==(EntityKey const& other) const noexcept = default;

  private:
    InnerType m_value { 0 };
};

} // namespace Refract

template <>
struct std::hash<Refract::EntityKey>
{
    REFRACT_API size_t operator()(Refract::EntityKey const& key) const noexcept;
};

template <>
struct std::formatter<Refract::EntityKey>: std::formatter<std::string>
{
    auto format(Refract::EntityKey const& key, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<std::string>::format(key.ToString(), ctx);
    }
};
