// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "NameConversion.hpp"
#include "RelationResolver.hpp"
#include "SchemaAnalyzer.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <utility>

namespace Refract
{

namespace
{

    struct TypeNameMapping
    {
        std::string_view name;
        FieldType type;
    };

    // clang-format off
    constexpr auto TypeNameTable = std::array {
        TypeNameMapping { "i8", FieldType::Int8 },
        TypeNameMapping { "int8_t", FieldType::Int8 },
        TypeNameMapping { "std::int8_t", FieldType::Int8 },
        TypeNameMapping { "signed char", FieldType::Int8 },
        TypeNameMapping { "i16", FieldType::Int16 },
        TypeNameMapping { "int16_t", FieldType::Int16 },
        TypeNameMapping { "std::int16_t", FieldType::Int16 },
        TypeNameMapping { "short", FieldType::Int16 },
        TypeNameMapping { "i32", FieldType::Int32 },
        TypeNameMapping { "int32_t", FieldType::Int32 },
        TypeNameMapping { "std::int32_t", FieldType::Int32 },
        TypeNameMapping { "int", FieldType::Int32 },
        TypeNameMapping { "i64", FieldType::Int64 },
        TypeNameMapping { "int64_t", FieldType::Int64 },
        TypeNameMapping { "std::int64_t", FieldType::Int64 },
        TypeNameMapping { "long long", FieldType::Int64 },
        TypeNameMapping { "u8", FieldType::UInt8 },
        TypeNameMapping { "uint8_t", FieldType::UInt8 },
        TypeNameMapping { "std::uint8_t", FieldType::UInt8 },
        TypeNameMapping { "unsigned char", FieldType::UInt8 },
        TypeNameMapping { "u16", FieldType::UInt16 },
        TypeNameMapping { "uint16_t", FieldType::UInt16 },
        TypeNameMapping { "std::uint16_t", FieldType::UInt16 },
        TypeNameMapping { "unsigned short", FieldType::UInt16 },
        TypeNameMapping { "u32", FieldType::UInt32 },
        TypeNameMapping { "uint32_t", FieldType::UInt32 },
        TypeNameMapping { "std::uint32_t", FieldType::UInt32 },
        TypeNameMapping { "unsigned", FieldType::UInt32 },
        TypeNameMapping { "unsigned int", FieldType::UInt32 },
        TypeNameMapping { "u64", FieldType::UInt64 },
        TypeNameMapping { "uint64_t", FieldType::UInt64 },
        TypeNameMapping { "std::uint64_t", FieldType::UInt64 },
        TypeNameMapping { "unsigned long long", FieldType::UInt64 },
        TypeNameMapping { "f32", FieldType::Float32 },
        TypeNameMapping { "float", FieldType::Float32 },
        TypeNameMapping { "f64", FieldType::Float64 },
        TypeNameMapping { "double", FieldType::Float64 },
        TypeNameMapping { "String", FieldType::String },
        TypeNameMapping { "string", FieldType::String },
        TypeNameMapping { "std::string", FieldType::String },
        TypeNameMapping { "bool", FieldType::Bool },
        TypeNameMapping { "Date", FieldType::Date },
        TypeNameMapping { "NaiveDate", FieldType::Date },
        TypeNameMapping { "SqlDate", FieldType::Date },
        TypeNameMapping { "Time", FieldType::Time },
        TypeNameMapping { "NaiveTime", FieldType::Time },
        TypeNameMapping { "SqlTime", FieldType::Time },
        TypeNameMapping { "DateTime", FieldType::DateTime },
        TypeNameMapping { "NaiveDateTime", FieldType::DateTime },
        TypeNameMapping { "DateTimeUtc", FieldType::DateTime },
        TypeNameMapping { "SqlDateTime", FieldType::DateTime },
        TypeNameMapping { "Uuid", FieldType::Uuid },
        TypeNameMapping { "uuid::Uuid", FieldType::Uuid },
        TypeNameMapping { "SqlGuid", FieldType::Uuid },
        TypeNameMapping { "Json", FieldType::Json },
        TypeNameMapping { "serde_json::Value", FieldType::Json },
        TypeNameMapping { "nlohmann::json", FieldType::Json },
    };
    // clang-format on

    std::string_view Trim(std::string_view text) noexcept
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        while (!text.empty() && text.back() == ' ')
            text.remove_suffix(1);
        return text;
    }

    // Returns the template argument if text is "<prefix><...>".
    std::optional<std::string_view> UnwrapTemplate(std::string_view text, std::string_view prefix) noexcept
    {
        if (!text.starts_with(prefix) || text.size() <= prefix.size() + 1 || text[prefix.size()] != '<'
            || text.back() != '>')
            return std::nullopt;
        return Trim(text.substr(prefix.size() + 1, text.size() - prefix.size() - 2));
    }

    std::optional<RelationKind> ParseRelationKind(std::string_view keyword) noexcept
    {
        if (keyword == "has_many")
            return RelationKind::HasMany;
        if (keyword == "belongs_to")
            return RelationKind::BelongsTo;
        if (keyword == "has_one")
            return RelationKind::HasOne;
        return std::nullopt;
    }

} // namespace

TypeDescriptor SchemaAnalyzer::ParseTypeName(std::string_view typeName)
{
    auto result = TypeDescriptor {};
    auto name = Trim(typeName);

    for (auto const wrapper: { "Option", "std::optional", "optional" })
    {
        if (auto const inner = UnwrapTemplate(name, wrapper); inner)
        {
            result.nullable = true;
            name = *inner;
            break;
        }
    }

    result.typeName = std::string(name);
    if (auto const it = std::ranges::find(TypeNameTable, name, &TypeNameMapping::name); it != TypeNameTable.end())
        result.type = it->type;
    return result;
}

std::string_view SchemaAnalyzer::TargetEntityName(std::string_view targetPath) noexcept
{
    auto const last = LastPathSegment(targetPath);
    if (last != "Entity" || last.size() == targetPath.size())
        return last;

    auto const parent = targetPath.substr(0, targetPath.size() - last.size() - 2);
    return LastPathSegment(parent);
}

std::string SchemaAnalyzer::ColumnReferenceToFieldName(std::string_view columnReference)
{
    return ToSnakeCase(LastPathSegment(Trim(columnReference)));
}

FieldInfo SchemaAnalyzer::AnalyzeField(EntityDeclaration const& entity, FieldDeclaration const& field)
{
    if (field.name.empty())
        throw SchemaError(entity.name, "field without a name");

    auto const descriptor = ParseTypeName(field.type);

    auto info = FieldInfo {};
    info.name = ToSnakeCase(field.name);
    info.columnName = field.columnName.value_or(info.name);
    info.type = descriptor.type;
    info.declaredType = descriptor.typeName;
    info.nullable = descriptor.nullable || field.nullable;
    info.unique = field.unique || field.primaryKey;
    info.primaryKey = field.primaryKey;

    if (info.primaryKey && info.nullable)
        throw SchemaError(entity.name, std::format("primary key {} must not be nullable", info.name));

    return info;
}

RelationInfo SchemaAnalyzer::AnalyzeRelation(EntityDeclaration const& entity,
                                             EntityInfo const& info,
                                             RelationDeclaration const& relation)
{
    auto const kind = ParseRelationKind(relation.kind);
    if (!kind)
        throw SchemaError(entity.name,
                          std::format("relation {} has unknown kind \"{}\"", relation.name, relation.kind));
    if (relation.target.empty())
        throw SchemaError(entity.name, std::format("relation {} has no target", relation.name));

    auto result = RelationInfo {};
    result.name = ToSnakeCase(relation.name);
    result.kind = *kind;
    result.targetEntity = std::string(TargetEntityName(relation.target));

    auto const fromField = relation.from.empty() ? std::string {} : ColumnReferenceToFieldName(relation.from);
    auto const toField = relation.to.empty() ? std::string {} : ColumnReferenceToFieldName(relation.to);

    // belongs_to: from is the foreign key here, to the referenced key of the target.
    // has_many and has_one: from is the referenced key here, to the foreign key of the target.
    if (result.OwnsForeignKey())
    {
        result.foreignKeyField = fromField;
        result.referencedField = toField;
    }
    else
    {
        result.foreignKeyField = toField;
        result.referencedField = fromField.empty() ? info.PrimaryKey().name : fromField;
    }

    if (result.foreignKeyField.empty())
        throw SchemaError(entity.name, std::format("relation {} names no foreign key column", result.name));

    // The foreign key type is known here if the foreign key lives on this entity,
    // which is the case for belongs_to and for self references.
    bool const foreignKeyIsLocal =
        result.OwnsForeignKey() || NormalizeEntityName(result.targetEntity) == NormalizeEntityName(entity.name);
    if (foreignKeyIsLocal)
    {
        if (auto const* field = info.FindField(result.foreignKeyField); field)
        {
            result.foreignKeyType = field->type;
            result.foreignKeyNullable = field->nullable;
        }
    }

    return result;
}

EntityInfo SchemaAnalyzer::Analyze(EntityDeclaration const& declaration)
{
    if (!declaration.tableName || declaration.tableName->empty())
        throw SchemaError(declaration.name, "missing table name");

    if (declaration.fields.empty())
        throw SchemaError(declaration.name, "declares no fields");

    auto info = EntityInfo {};
    info.name = declaration.name;
    info.tableName = *declaration.tableName;

    for (auto const& fieldDeclaration: declaration.fields)
    {
        auto field = AnalyzeField(declaration, fieldDeclaration);
        if (info.FindField(field.name))
            throw SchemaError(declaration.name, std::format("duplicate field {}", field.name));
        info.fields.emplace_back(std::move(field));
    }

    auto const primaryKeyCount = std::ranges::count_if(info.fields, &FieldInfo::primaryKey);
    if (primaryKeyCount == 0)
        throw SchemaError(declaration.name, "missing primary key");
    if (primaryKeyCount > 1)
        throw SchemaError(declaration.name, "declares more than one primary key");

    for (auto const& relationDeclaration: declaration.relations)
    {
        auto relation = AnalyzeRelation(declaration, info, relationDeclaration);
        if (info.FindRelation(relation.name))
            throw SchemaError(declaration.name, std::format("duplicate relation {}", relation.name));

        // Only the owning side records the foreign key field.
        if (relation.OwnsForeignKey() && relation.foreignKeyType)
        {
            if (!std::ranges::contains(info.foreignKeys, relation.foreignKeyField, &ForeignKeyInfo::fieldName))
                info.foreignKeys.emplace_back(
                    ForeignKeyInfo { .fieldName = relation.foreignKeyField, .type = *relation.foreignKeyType });
        }

        info.relations.emplace_back(std::move(relation));
    }

    return info;
}

std::vector<EntityInfo> CompileSchema(SchemaDeclaration const& schema)
{
    auto entities = std::vector<EntityInfo> {};
    entities.reserve(schema.entities.size());

    for (auto const& declaration: schema.entities)
        entities.emplace_back(SchemaAnalyzer::Analyze(declaration));

    RelationResolver { entities }.Resolve(entities);
    return entities;
}

} // namespace Refract
