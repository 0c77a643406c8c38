// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

/// Scalar type of an entity field.
enum class FieldType : uint8_t
{
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    String,
    Bool,
    Date,
    Time,
    DateTime,
    Uuid,
    Json,
    Opaque,
};

/// Groups field types by the operators they support.
enum class TypeClass : uint8_t
{
    Numeric,
    String,
    Boolean,
    Uuid,
    Temporal,
    Json,
    Opaque,
};

[[nodiscard]] REFRACT_API TypeClass ClassOf(FieldType type) noexcept;

[[nodiscard]] REFRACT_API std::string_view NameOf(FieldType type) noexcept;

[[nodiscard]] inline bool IsIntegral(FieldType type) noexcept
{
    return type >= FieldType::Int8 && type <= FieldType::UInt64;
}

[[nodiscard]] inline bool IsFloatingPoint(FieldType type) noexcept
{
    return type == FieldType::Float32 || type == FieldType::Float64;
}

struct FieldInfo
{
    std::string name;       // Field name as declared, snake_case
    std::string columnName; // Column name in the backing table
    FieldType type = FieldType::Opaque;
    std::string declaredType; // Type name as declared, with nullable wrappers removed
    bool nullable = false;
    bool unique = false;
    bool primaryKey = false;
};

enum class RelationKind : uint8_t
{
    HasMany,
    BelongsTo,
    HasOne,
};

[[nodiscard]] REFRACT_API std::string_view NameOf(RelationKind kind) noexcept;

struct RelationInfo
{
    std::string name;         // snake_case relation name, e.g. "posts"
    RelationKind kind = RelationKind::HasMany;
    std::string targetEntity; // Entity name as referenced by the declaration, e.g. "Post"
    std::string targetTable;  // Filled in by the RelationResolver

    /// Field holding the foreign key.
    ///
    /// For BelongsTo this is a field of the current entity, otherwise a field of the target entity.
    std::string foreignKeyField;

    /// Field the foreign key refers to: a key of the target for BelongsTo, else a key of the current entity.
    std::string referencedField;

    // Column names of the two fields above, filled in by the RelationResolver.
    std::string foreignKeyColumn;
    std::string referencedColumn;

    std::optional<FieldType> foreignKeyType;
    bool foreignKeyNullable = false;

    /// Tests if the current entity holds the foreign key.
    [[nodiscard]] bool OwnsForeignKey() const noexcept
    {
        return kind == RelationKind::BelongsTo;
    }

    /// Tests if the relation yields at most one related row.
    [[nodiscard]] bool IsSingle() const noexcept
    {
        return kind != RelationKind::HasMany;
    }

    /// Field of the current entity whose value identifies the related rows.
    [[nodiscard]] std::string const& LocalField() const noexcept
    {
        return OwnsForeignKey() ? foreignKeyField : referencedField;
    }

    /// Column of the target table matched against LocalField().
    [[nodiscard]] std::string const& RemoteColumn() const noexcept
    {
        return OwnsForeignKey() ? referencedColumn : foreignKeyColumn;
    }

    /// Field of the target entity matched against LocalField().
    [[nodiscard]] std::string const& RemoteField() const noexcept
    {
        return OwnsForeignKey() ? referencedField : foreignKeyField;
    }
};

struct ForeignKeyInfo
{
    std::string fieldName;
    FieldType type = FieldType::Opaque;
};

/// Metadata of one entity, as produced by the SchemaAnalyzer and completed by the RelationResolver.
///
/// Immutable once generation has finished.
struct REFRACT_API EntityInfo
{
    std::string name;
    std::string tableName;
    std::vector<FieldInfo> fields;
    std::vector<RelationInfo> relations;

    /// Foreign key fields of this entity, i.e. those of its BelongsTo relations.
    std::vector<ForeignKeyInfo> foreignKeys;

    [[nodiscard]] FieldInfo const& PrimaryKey() const;

    [[nodiscard]] FieldInfo const* FindField(std::string_view fieldName) const noexcept;

    [[nodiscard]] FieldInfo const* FindFieldByColumn(std::string_view columnName) const noexcept;

    /// Retrieves the field by its name, or throws QueryValidationError.
    [[nodiscard]] FieldInfo const& RequireField(std::string_view fieldName) const;

    [[nodiscard]] RelationInfo const* FindRelation(std::string_view relationName) const noexcept;

    /// Retrieves the relation by its name, or throws RelationNotFoundError.
    [[nodiscard]] RelationInfo const& RequireRelation(std::string_view relationName) const;
};

} // namespace Refract

template <>
struct std::formatter<Refract::FieldType>: std::formatter<std::string_view>
{
    auto format(Refract::FieldType value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string_view>::format(Refract::NameOf(value), ctx);
    }
};

template <>
struct std::formatter<Refract::RelationKind>: std::formatter<std::string_view>
{
    auto format(Refract::RelationKind value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string_view>::format(Refract::NameOf(value), ctx);
    }
};
