// SPDX-License-Identifier: Apache-2.0

#include "ValueConversion.hpp"

namespace Refract
{

namespace
{
    template <typename T>
    std::optional<SqlVariant> Box(std::optional<T> const& value)
    {
        if (!value)
            return std::nullopt;
        return SqlVariant { *value };
    }
} // namespace

std::optional<SqlVariant> TryConvertValue(SqlVariant const& value, FieldType type)
{
    if (value.IsNull())
        return value;

    switch (type)
    {
        case FieldType::Int8:
            return Box(value.TryGetIntegral<signed char>());
        case FieldType::Int16:
            return Box(value.TryGetIntegral<short>());
        case FieldType::Int32:
            return Box(value.TryGetIntegral<int>());
        case FieldType::Int64:
            return Box(value.TryGetIntegral<long long>());
        case FieldType::UInt8:
            return Box(value.TryGetIntegral<unsigned char>());
        case FieldType::UInt16:
            return Box(value.TryGetIntegral<unsigned short>());
        case FieldType::UInt32:
            return Box(value.TryGetIntegral<unsigned int>());
        case FieldType::UInt64:
            return Box(value.TryGetIntegral<unsigned long long>());
        case FieldType::Float32:
            return Box(value.TryGetDouble().transform([](double v) { return static_cast<float>(v); }));
        case FieldType::Float64:
            return Box(value.TryGetDouble());
        case FieldType::Bool:
            return Box(value.TryGetBool());
        case FieldType::Uuid:
            return Box(value.TryGetGuid());
        case FieldType::Date:
            return Box(value.TryGetDate());
        case FieldType::Time:
            return Box(value.TryGetTime());
        case FieldType::DateTime:
            return Box(value.TryGetDateTime());
        case FieldType::String:
        case FieldType::Json:
        case FieldType::Opaque:
            if (value.Is<std::string>())
                return value;
            return SqlVariant { value.ToString() };
    }
    return std::nullopt;
}

SqlVariant ConvertValue(SqlVariant const& value, FieldType type)
{
    if (auto result = TryConvertValue(value, type); result)
        return std::move(*result);
    throw KeyConversionError(std::format("Cannot convert value {} to {}", value, type));
}

SqlVariant NormalizeValue(SqlVariant value, FieldType type)
{
    if (auto result = TryConvertValue(value, type); result)
        return std::move(*result);
    return value;
}

} // namespace Refract
