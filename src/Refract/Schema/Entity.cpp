// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "Entity.hpp"

#include <algorithm>

namespace Refract
{

TypeClass ClassOf(FieldType type) noexcept
{
    switch (type)
    {
        case FieldType::Int8:
        case FieldType::Int16:
        case FieldType::Int32:
        case FieldType::Int64:
        case FieldType::UInt8:
        case FieldType::UInt16:
        case FieldType::UInt32:
        case FieldType::UInt64:
        case FieldType::Float32:
        case FieldType::Float64:
            return TypeClass::Numeric;
        case FieldType::String:
            return TypeClass::String;
        case FieldType::Bool:
            return TypeClass::Boolean;
        case FieldType::Date:
        case FieldType::Time:
        case FieldType::DateTime:
            return TypeClass::Temporal;
        case FieldType::Uuid:
            return TypeClass::Uuid;
        case FieldType::Json:
            return TypeClass::Json;
        case FieldType::Opaque:
            break;
    }
    return TypeClass::Opaque;
}

std::string_view NameOf(FieldType type) noexcept
{
    switch (type)
    {
        case FieldType::Int8:
            return "Int8";
        case FieldType::Int16:
            return "Int16";
        case FieldType::Int32:
            return "Int32";
        case FieldType::Int64:
            return "Int64";
        case FieldType::UInt8:
            return "UInt8";
        case FieldType::UInt16:
            return "UInt16";
        case FieldType::UInt32:
            return "UInt32";
        case FieldType::UInt64:
            return "UInt64";
        case FieldType::Float32:
            return "Float32";
        case FieldType::Float64:
            return "Float64";
        case FieldType::String:
            return "String";
        case FieldType::Bool:
            return "Bool";
        case FieldType::Date:
            return "Date";
        case FieldType::Time:
            return "Time";
        case FieldType::DateTime:
            return "DateTime";
        case FieldType::Uuid:
            return "Uuid";
        case FieldType::Json:
            return "Json";
        case FieldType::Opaque:
            break;
    }
    return "Opaque";
}

std::string_view NameOf(RelationKind kind) noexcept
{
    switch (kind)
    {
        case RelationKind::HasMany:
            return "HasMany";
        case RelationKind::BelongsTo:
            return "BelongsTo";
        case RelationKind::HasOne:
            return "HasOne";
    }
    return "Unknown";
}

FieldInfo const& EntityInfo::PrimaryKey() const
{
    auto const it = std::ranges::find_if(fields, [](FieldInfo const& field) { return field.primaryKey; });
    if (it == fields.end())
        throw SchemaError(name, "no primary key");
    return *it;
}

FieldInfo const* EntityInfo::FindField(std::string_view fieldName) const noexcept
{
    auto const it = std::ranges::find(fields, fieldName, &FieldInfo::name);
    return it != fields.end() ? &*it : nullptr;
}

FieldInfo const* EntityInfo::FindFieldByColumn(std::string_view columnName) const noexcept
{
    auto const it = std::ranges::find(fields, columnName, &FieldInfo::columnName);
    return it != fields.end() ? &*it : nullptr;
}

FieldInfo const& EntityInfo::RequireField(std::string_view fieldName) const
{
    if (auto const* field = FindField(fieldName); field)
        return *field;
    throw QueryValidationError(std::format("Entity {} has no field named {}", name, fieldName));
}

RelationInfo const* EntityInfo::FindRelation(std::string_view relationName) const noexcept
{
    auto const it = std::ranges::find(relations, relationName, &RelationInfo::name);
    return it != relations.end() ? &*it : nullptr;
}

RelationInfo const& EntityInfo::RequireRelation(std::string_view relationName) const
{
    if (auto const* relation = FindRelation(relationName); relation)
        return *relation;
    throw RelationNotFoundError(name, relationName);
}

} // namespace Refract
