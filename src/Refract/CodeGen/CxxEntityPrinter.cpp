// SPDX-License-Identifier: Apache-2.0

#include "../Predicate/OperatorTable.hpp"
#include "../Schema/NameConversion.hpp"
#include "../Schema/RelationResolver.hpp"
#include "../SqlLogger.hpp"
#include "CxxEntityPrinter.hpp"

#include <algorithm>
#include <format>

namespace Refract
{

namespace
{

    std::string Quote(std::string_view text)
    {
        std::string result;
        result.reserve(text.size() + 2);
        result += '"';
        for (char const c: text)
        {
            if (c == '"' || c == '\\')
                result += '\\';
            result += c;
        }
        result += '"';
        return result;
    }

    std::string_view BaseTypeOf(FieldInfo const& field)
    {
        switch (field.type)
        {
            case FieldType::Int8:
                return "int8_t";
            case FieldType::Int16:
                return "int16_t";
            case FieldType::Int32:
                return "int32_t";
            case FieldType::Int64:
                return "int64_t";
            case FieldType::UInt8:
                return "uint8_t";
            case FieldType::UInt16:
                return "uint16_t";
            case FieldType::UInt32:
                return "uint32_t";
            case FieldType::UInt64:
                return "uint64_t";
            case FieldType::Float32:
                return "float";
            case FieldType::Float64:
                return "double";
            case FieldType::String:
            case FieldType::Json:
                return "std::string";
            case FieldType::Bool:
                return "bool";
            case FieldType::Date:
                return "SqlDate";
            case FieldType::Time:
                return "SqlTime";
            case FieldType::DateTime:
                return "SqlDateTime";
            case FieldType::Uuid:
                return "SqlGuid";
            case FieldType::Opaque:
                break;
        }
        // Opaque types are spelled as declared, and converted through a ValueConverter specialization.
        return field.declaredType;
    }

    // Scalars are passed by value, everything else by const reference.
    std::string ParameterTypeOf(FieldInfo const& field)
    {
        if (ClassOf(field.type) == TypeClass::Numeric || field.type == FieldType::Bool)
            return std::string(BaseTypeOf(field));
        return std::format("{} const&", BaseTypeOf(field));
    }

    bool IsAutoAssignedKey(FieldInfo const& field) noexcept
    {
        return field.primaryKey && !field.nullable && IsIntegral(field.type);
    }

    std::string EntityNamespaceOf(EntityInfo const& entity)
    {
        return ToSnakeCase(entity.name);
    }

    std::string StructNameOf(std::string_view entityName)
    {
        return ToPascalCase(LastPathSegment(entityName));
    }

    std::string FieldPredicateHead(FieldInfo const& field, FieldOperator op)
    {
        return std::format("Refract::FieldPredicate {{ .field = {}, .op = Refract::FieldOperator::{}",
                           Quote(field.name),
                           NameOf(op));
    }

} // namespace

std::string CxxTypeOf(FieldInfo const& field)
{
    if (field.nullable)
        return std::format("std::optional<{}>", BaseTypeOf(field));
    return std::string(BaseTypeOf(field));
}

CxxEntityPrinter::CxxEntityPrinter(std::vector<EntityInfo> entities):
    m_entities { std::move(entities) }
{
    for (auto const& entity: m_entities)
        PrintStruct(entity);

    for (auto const& entity: m_entities)
    {
        PrintMetadata(entity);
        PrintRecordConversion(entity);
        PrintEquality(entity);
    }

    for (auto const& entity: m_entities)
    {
        auto const entityNamespace = EntityNamespaceOf(entity);
        m_definitions << std::format("namespace {}\n{{\n\n", entityNamespace);
        PrintWhereNamespace(entity);
        PrintSetNamespace(entity);
        PrintOrderNamespace(entity);
        for (auto const& relation: entity.relations)
            PrintRelationNamespace(entity, relation);

        m_definitions << std::format("inline Refract::EntityClient<{0}> Client(Refract::Client const& client)\n"
                                     "{{\n"
                                     "    return client.Entity<{0}>();\n"
                                     "}}\n\n",
                                     StructNameOf(entity.name));
        m_definitions << std::format("}} // namespace {}\n\n", entityNamespace);

        SqlLogger::GetLogger().OnEntityGenerated(entity.name);
    }

    PrintRegisterFunction();
}

std::string CxxEntityPrinter::str(std::string_view modelNamespace) const
{
    auto forwardDeclarations = std::vector<std::string> {};
    for (auto const& entity: m_entities)
        forwardDeclarations.emplace_back(StructNameOf(entity.name));
    std::ranges::sort(forwardDeclarations);

    std::stringstream output;
    output << "// SPDX-License-Identifier: Apache-2.0\n";
    output << "// This file is generated. Do not edit.\n\n";
    output << "#pragma once\n\n";
    output << "#include <Refract/Refract.hpp>\n\n";
    if (!modelNamespace.empty())
        output << std::format("namespace {}\n{{\n\n", modelNamespace);
    for (auto const& name: forwardDeclarations)
        output << std::format("struct {};\n", name);
    output << "\n";
    output << m_definitions.str();
    if (!modelNamespace.empty())
        output << std::format("}} // namespace {}\n", modelNamespace);

    return output.str();
}

std::string CxxEntityPrinter::TargetTypeName(RelationInfo const& relation) const
{
    auto const resolver = RelationResolver { m_entities };
    if (auto const* target = resolver.FindEntity(relation.targetEntity); target)
        return StructNameOf(target->name);
    return {};
}

void CxxEntityPrinter::PrintStruct(EntityInfo const& entity)
{
    auto const structName = StructNameOf(entity.name);

    m_definitions << std::format("struct {}\n{{\n", structName);
    for (auto const& field: entity.fields)
        m_definitions << std::format("    {} {} {{}};\n", CxxTypeOf(field), field.name);

    if (!entity.relations.empty())
    {
        m_definitions << "\n    // Relations, filled in when included by a read\n";
        for (auto const& relation: entity.relations)
        {
            auto targetType = TargetTypeName(relation);
            if (targetType.empty())
                targetType = "Refract::SqlRecord";

            if (relation.IsSingle())
                m_definitions << std::format("    std::shared_ptr<{}> {};\n", targetType, relation.name);
            else
                m_definitions << std::format("    std::optional<std::vector<{}>> {};\n", targetType, relation.name);
        }
    }

    m_definitions << "    std::vector<std::pair<std::string, size_t>> relationCounts;\n\n";
    m_definitions << "    static Refract::EntityInfo const& Metadata();\n";
    m_definitions << "    [[nodiscard]] Refract::SqlRecord ToRecord() const;\n";
    m_definitions << std::format("    [[nodiscard]] static {} FromRecord(Refract::SqlRecord const& record);\n\n",
                                 structName);
    // Single relations are held by pointer, so their slots need a comparison by value.
    if (std::ranges::any_of(entity.relations, &RelationInfo::IsSingle))
        m_definitions << std::format("    bool operator==({} const& other) const;\n", structName);
    else
        m_definitions << std::format("    bool operator==({} const&) const = default;\n", structName);
    m_definitions << "};\n\n";
}

void CxxEntityPrinter::PrintEquality(EntityInfo const& entity)
{
    if (!std::ranges::any_of(entity.relations, &RelationInfo::IsSingle))
        return;

    auto const structName = StructNameOf(entity.name);
    m_definitions << std::format("inline bool {0}::operator==({0} const& other) const\n{{\n    return ", structName);

    for (auto const& field: entity.fields)
        m_definitions << std::format("{0} == other.{0}\n        && ", field.name);
    for (auto const& relation: entity.relations)
    {
        if (relation.IsSingle())
            m_definitions << std::format("Refract::SameRelated({0}, other.{0})\n        && ", relation.name);
        else
            m_definitions << std::format("{0} == other.{0}\n        && ", relation.name);
    }
    m_definitions << "relationCounts == other.relationCounts;\n}\n\n";
}

void CxxEntityPrinter::PrintMetadata(EntityInfo const& entity)
{
    m_definitions << std::format("inline Refract::EntityInfo const& {}::Metadata()\n{{\n", StructNameOf(entity.name));
    m_definitions << "    static auto const info = Refract::EntityInfo {\n";
    m_definitions << std::format("        .name = {},\n", Quote(entity.name));
    m_definitions << std::format("        .tableName = {},\n", Quote(entity.tableName));

    m_definitions << "        .fields = {\n";
    for (auto const& field: entity.fields)
    {
        m_definitions << std::format("            Refract::FieldInfo {{ .name = {}, .columnName = {}, "
                                     ".type = Refract::FieldType::{}, .declaredType = {}, "
                                     ".nullable = {}, .unique = {}, .primaryKey = {} }},\n",
                                     Quote(field.name),
                                     Quote(field.columnName),
                                     field.type,
                                     Quote(field.declaredType),
                                     field.nullable,
                                     field.unique,
                                     field.primaryKey);
    }
    m_definitions << "        },\n";

    m_definitions << "        .relations = {\n";
    for (auto const& relation: entity.relations)
    {
        auto const foreignKeyType = relation.foreignKeyType
                                        ? std::format("Refract::FieldType::{}", *relation.foreignKeyType)
                                        : std::string("std::nullopt");
        m_definitions << std::format("            Refract::RelationInfo {{ .name = {}, .kind = Refract::RelationKind::{}, "
                                     ".targetEntity = {}, .targetTable = {}, "
                                     ".foreignKeyField = {}, .referencedField = {}, "
                                     ".foreignKeyColumn = {}, .referencedColumn = {}, "
                                     ".foreignKeyType = {}, .foreignKeyNullable = {} }},\n",
                                     Quote(relation.name),
                                     relation.kind,
                                     Quote(relation.targetEntity),
                                     Quote(relation.targetTable),
                                     Quote(relation.foreignKeyField),
                                     Quote(relation.referencedField),
                                     Quote(relation.foreignKeyColumn),
                                     Quote(relation.referencedColumn),
                                     foreignKeyType,
                                     relation.foreignKeyNullable);
    }
    m_definitions << "        },\n";

    m_definitions << "        .foreignKeys = {\n";
    for (auto const& foreignKey: entity.foreignKeys)
        m_definitions << std::format(
            "            Refract::ForeignKeyInfo {{ .fieldName = {}, .type = Refract::FieldType::{} }},\n",
            Quote(foreignKey.fieldName),
            foreignKey.type);
    m_definitions << "        },\n";

    m_definitions << "    };\n";
    m_definitions << "    return info;\n";
    m_definitions << "}\n\n";
}

void CxxEntityPrinter::PrintRecordConversion(EntityInfo const& entity)
{
    auto const structName = StructNameOf(entity.name);

    m_definitions << std::format("inline Refract::SqlRecord {}::ToRecord() const\n{{\n", structName);
    m_definitions << "    auto record = Refract::SqlRecord {};\n";
    for (auto const& field: entity.fields)
    {
        if (IsAutoAssignedKey(field))
        {
            m_definitions << "    // A zero key is assigned by the database on insert.\n";
            m_definitions << std::format("    if ({} != 0)\n    ", field.name);
        }
        m_definitions << std::format("    record.Set({}, Refract::ToSqlValue({}));\n", Quote(field.name), field.name);
    }
    m_definitions << "    return record;\n";
    m_definitions << "}\n\n";

    m_definitions << std::format("inline {0} {0}::FromRecord(Refract::SqlRecord const& record)\n{{\n", structName);
    m_definitions << std::format("    auto result = {} {{}};\n", structName);
    for (auto const& field: entity.fields)
    {
        m_definitions << std::format("    if (auto const* value = record.Find({}); value)\n", Quote(field.name));
        m_definitions << std::format(
            "        result.{} = Refract::FromSqlValue<{}>(*value);\n", field.name, CxxTypeOf(field));
    }

    for (auto const& relation: entity.relations)
    {
        auto const targetType = TargetTypeName(relation);
        if (relation.IsSingle())
        {
            m_definitions << std::format(
                "    if (auto const* slot = record.FindRelation({}); slot && !slot->rows.empty())\n", Quote(relation.name));
            if (targetType.empty())
                m_definitions << std::format(
                    "        result.{} = std::make_shared<Refract::SqlRecord>(slot->rows.front());\n", relation.name);
            else
                m_definitions << std::format(
                    "        result.{} = std::make_shared<{}>({}::FromRecord(slot->rows.front()));\n",
                    relation.name,
                    targetType,
                    targetType);
        }
        else
        {
            m_definitions << std::format("    if (auto const* slot = record.FindRelation({}); slot)\n",
                                         Quote(relation.name));
            if (targetType.empty())
                m_definitions << std::format("        result.{} = slot->rows;\n", relation.name);
            else
                m_definitions << std::format(
                    "        result.{} = Refract::FromSqlRecords<{}>(std::vector<Refract::SqlRecord>(slot->rows));\n",
                    relation.name,
                    targetType);
        }
    }

    m_definitions << "    result.relationCounts = record.Counts();\n";
    m_definitions << "    return result;\n";
    m_definitions << "}\n\n";
}

void CxxEntityPrinter::PrintWhereNamespace(EntityInfo const& entity)
{
    m_definitions << "namespace where\n{\n";
    for (auto const& field: entity.fields)
    {
        auto const baseType = BaseTypeOf(field);
        auto const parameterType = ParameterTypeOf(field);

        m_definitions << std::format("    namespace {}\n    {{\n", field.name);

        if (field.unique)
        {
            // Primary keys take a key of any type, converted to the column type on compilation.
            if (field.primaryKey)
                m_definitions << std::format(
                    "        inline Refract::UniqueSelector Unique(Refract::EntityKey key)\n"
                    "        {{\n"
                    "            return Refract::UniqueSelector {{ .field = {}, .value = std::move(key) }};\n"
                    "        }}\n\n",
                    Quote(field.name));
            else
                m_definitions << std::format(
                    "        inline Refract::UniqueSelector Unique({} value)\n"
                    "        {{\n"
                    "            return Refract::UniqueSelector {{ .field = {}, .value = Refract::ToSqlValue(value) }};\n"
                    "        }}\n\n",
                    parameterType,
                    Quote(field.name));
        }

        if (IsQueryModeAllowed(field))
            m_definitions << std::format(
                "        inline Refract::Predicate Mode(Refract::QueryMode mode)\n"
                "        {{\n"
                "            return Refract::ModePredicate {{ .field = {}, .mode = mode }};\n"
                "        }}\n\n",
                Quote(field.name));

        for (auto const op: AllowedOperators(field))
        {
            auto const name = NameOf(op);
            auto const head = FieldPredicateHead(field, op);
            switch (op)
            {
                case FieldOperator::Equals:
                    if (field.primaryKey)
                    {
                        m_definitions << std::format(
                            "        inline Refract::Predicate Equals(Refract::EntityKey key)\n"
                            "        {{\n"
                            "            return Refract::KeyPredicate {{ .field = {}, .key = std::move(key) }};\n"
                            "        }}\n\n",
                            Quote(field.name));
                        break;
                    }
                    [[fallthrough]];
                case FieldOperator::NotEquals:
                case FieldOperator::GreaterThan:
                case FieldOperator::LessThan:
                case FieldOperator::GreaterOrEqual:
                case FieldOperator::LessOrEqual:
                    m_definitions << std::format("        inline Refract::Predicate {}({} value)\n"
                                                 "        {{\n"
                                                 "            return {}, .values = {{ Refract::ToSqlValue(value) }} }};\n"
                                                 "        }}\n\n",
                                                 name,
                                                 parameterType,
                                                 head);
                    break;
                case FieldOperator::Contains:
                case FieldOperator::StartsWith:
                case FieldOperator::EndsWith:
                    m_definitions << std::format("        inline Refract::Predicate {}(std::string value)\n"
                                                 "        {{\n"
                                                 "            return {}, .values = {{ Refract::SqlVariant {{ std::move(value) }} }} }};\n"
                                                 "        }}\n\n",
                                                 name,
                                                 head);
                    break;
                case FieldOperator::InSet:
                case FieldOperator::NotInSet:
                    m_definitions << std::format("        inline Refract::Predicate {}(std::vector<{}> const& values)\n"
                                                 "        {{\n"
                                                 "            auto predicate = {} }};\n"
                                                 "            for (auto const& value: values)\n"
                                                 "                predicate.values.emplace_back(Refract::ToSqlValue(value));\n"
                                                 "            return predicate;\n"
                                                 "        }}\n\n",
                                                 name,
                                                 baseType,
                                                 head);
                    break;
                case FieldOperator::IsNull:
                case FieldOperator::IsNotNull:
                    m_definitions << std::format("        inline Refract::Predicate {}()\n"
                                                 "        {{\n"
                                                 "            return {} }};\n"
                                                 "        }}\n\n",
                                                 name,
                                                 head);
                    break;
                case FieldOperator::JsonPathEquals:
                case FieldOperator::JsonArrayContains:
                case FieldOperator::JsonArrayStartsWith:
                case FieldOperator::JsonArrayEndsWith:
                    m_definitions << std::format(
                        "        inline Refract::Predicate {}(std::vector<std::string> path, Refract::SqlVariant value)\n"
                        "        {{\n"
                        "            return {}, .values = {{ std::move(value) }}, .jsonPath = std::move(path) }};\n"
                        "        }}\n\n",
                        name,
                        head);
                    break;
                case FieldOperator::JsonStringContains:
                case FieldOperator::JsonStringStartsWith:
                case FieldOperator::JsonStringEndsWith:
                    m_definitions << std::format(
                        "        inline Refract::Predicate {}(std::vector<std::string> path, std::string value)\n"
                        "        {{\n"
                        "            return {}, .values = {{ Refract::SqlVariant {{ std::move(value) }} }}, "
                        ".jsonPath = std::move(path) }};\n"
                        "        }}\n\n",
                        name,
                        head);
                    break;
                case FieldOperator::JsonHasKey:
                    m_definitions << std::format("        inline Refract::Predicate {}(std::vector<std::string> path)\n"
                                                 "        {{\n"
                                                 "            return {}, .values = {{}}, .jsonPath = std::move(path) }};\n"
                                                 "        }}\n\n",
                                                 name,
                                                 head);
                    break;
                case FieldOperator::JsonNull:
                    m_definitions << std::format(
                        "        inline Refract::Predicate {}(Refract::JsonNullKind kind = Refract::JsonNullKind::JsonNull)\n"
                        "        {{\n"
                        "            return {}, .values = {{}}, .jsonPath = {{}}, .nullKind = kind }};\n"
                        "        }}\n\n",
                        name,
                        head);
                    break;
            }
        }

        m_definitions << std::format("    }} // namespace {}\n\n", field.name);
    }
    m_definitions << "} // namespace where\n\n";
}

void CxxEntityPrinter::PrintSetNamespace(EntityInfo const& entity)
{
    m_definitions << "namespace set\n{\n";
    for (auto const& field: entity.fields)
    {
        m_definitions << std::format("    namespace {}\n    {{\n", field.name);
        for (auto const kind: AllowedMutations(field))
        {
            if (kind == MutationKind::SetNull)
                m_definitions << std::format("        inline Refract::FieldMutation SetNull()\n"
                                             "        {{\n"
                                             "            return Refract::FieldMutation {{ .field = {}, "
                                             ".kind = Refract::MutationKind::SetNull, .value = Refract::SqlVariant {{ SqlNullValue }} }};\n"
                                             "        }}\n\n",
                                             Quote(field.name));
            else
                m_definitions << std::format("        inline Refract::FieldMutation {0}({1} value)\n"
                                             "        {{\n"
                                             "            return Refract::FieldMutation {{ .field = {2}, "
                                             ".kind = Refract::MutationKind::{0}, .value = Refract::ToSqlValue(value) }};\n"
                                             "        }}\n\n",
                                             NameOf(kind),
                                             ParameterTypeOf(field),
                                             Quote(field.name));
        }
        m_definitions << std::format("    }} // namespace {}\n\n", field.name);
    }
    m_definitions << "} // namespace set\n\n";
}

void CxxEntityPrinter::PrintOrderNamespace(EntityInfo const& entity)
{
    m_definitions << "namespace order\n{\n";
    for (auto const& field: entity.fields)
        m_definitions << std::format(
            "    inline Refract::OrderSpec {}(Refract::SortOrder order = Refract::SortOrder::Asc,\n"
            "                                 Refract::NullsOrder nulls = Refract::NullsOrder::Default)\n"
            "    {{\n"
            "        return Refract::OrderSpec {{ .field = {}, .order = order, .nulls = nulls }};\n"
            "    }}\n\n",
            field.name,
            Quote(field.name));
    m_definitions << "} // namespace order\n\n";
}

void CxxEntityPrinter::PrintRelationNamespace(EntityInfo const& entity, RelationInfo const& relation)
{
    auto const structName = StructNameOf(entity.name);
    auto const targetType = TargetTypeName(relation);
    auto const name = Quote(relation.name);

    m_definitions << std::format("namespace {}\n{{\n", relation.name);

    for (auto const quantifier: { "Some", "Every", "None" })
        m_definitions << std::format(
            "    inline Refract::Predicate {0}(std::vector<Refract::Predicate> predicates)\n"
            "    {{\n"
            "        return Refract::RelationPredicate {{ .relation = {1}, "
            ".quantifier = Refract::RelationQuantifier::{0}, .predicates = std::move(predicates) }};\n"
            "    }}\n\n",
            quantifier,
            name);

    m_definitions << std::format("    inline Refract::IncludeBuilder Include()\n"
                                 "    {{\n"
                                 "        return Refract::IncludeBuilder {{ {} }};\n"
                                 "    }}\n\n",
                                 name);

    // Fetch
    if (targetType.empty())
        m_definitions << std::format(
            "    inline std::vector<Refract::SqlRecord> Fetch(Refract::Client const& client,\n"
            "                                                 {} const& parent,\n"
            "                                                 Refract::ReadSpec const& spec = {{}})\n"
            "    {{\n"
            "        return client.Entity<{}>().FetchRelated(parent, {}, spec);\n"
            "    }}\n\n",
            structName,
            structName,
            name);
    else if (relation.IsSingle())
        m_definitions << std::format(
            "    inline std::optional<{0}> Fetch(Refract::Client const& client,\n"
            "                                    {1} const& parent,\n"
            "                                    Refract::ReadSpec const& spec = {{}})\n"
            "    {{\n"
            "        auto rows = client.Entity<{1}>().FetchRelated(parent, {2}, spec);\n"
            "        if (rows.empty())\n"
            "            return std::nullopt;\n"
            "        return {0}::FromRecord(rows.front());\n"
            "    }}\n\n",
            targetType,
            structName,
            name);
    else
        m_definitions << std::format(
            "    inline std::vector<{0}> Fetch(Refract::Client const& client,\n"
            "                                  {1} const& parent,\n"
            "                                  Refract::ReadSpec const& spec = {{}})\n"
            "    {{\n"
            "        return Refract::FromSqlRecords<{0}>(client.Entity<{1}>().FetchRelated(parent, {2}, spec));\n"
            "    }}\n\n",
            targetType,
            structName,
            name);

    // Connect
    if (relation.IsSingle())
        m_definitions << std::format("    inline Refract::RelationMutation Connect(Refract::UniqueSelector selector)\n"
                                     "    {{\n"
                                     "        return Refract::ConnectRelation({}, {{ std::move(selector) }});\n"
                                     "    }}\n\n",
                                     name);
    else
        m_definitions << std::format(
            "    inline Refract::RelationMutation Connect(std::vector<Refract::UniqueSelector> selectors)\n"
            "    {{\n"
            "        return Refract::ConnectRelation({}, std::move(selectors));\n"
            "    }}\n\n",
            name);

    if (relation.kind == RelationKind::BelongsTo && relation.foreignKeyNullable)
        m_definitions << std::format("    inline Refract::RelationMutation Disconnect()\n"
                                     "    {{\n"
                                     "        return Refract::DisconnectRelation({});\n"
                                     "    }}\n\n",
                                     name);

    if (relation.kind == RelationKind::HasMany)
        m_definitions << std::format(
            "    inline Refract::RelationMutation Set(std::vector<Refract::UniqueSelector> selectors)\n"
            "    {{\n"
            "        return Refract::SetRelation({}, std::move(selectors));\n"
            "    }}\n\n",
            name);

    if (relation.kind != RelationKind::BelongsTo)
    {
        if (targetType.empty())
            m_definitions << std::format(
                "    inline Refract::RelationMutation CreateNested(std::vector<Refract::SqlRecord> rows)\n"
                "    {{\n"
                "        return Refract::CreateNestedRelation({}, std::move(rows));\n"
                "    }}\n\n",
                name);
        else
            m_definitions << std::format(
                "    inline Refract::RelationMutation CreateNested(std::vector<{}> const& rows)\n"
                "    {{\n"
                "        auto records = std::vector<Refract::SqlRecord> {{}};\n"
                "        for (auto const& row: rows)\n"
                "            records.emplace_back(row.ToRecord());\n"
                "        return Refract::CreateNestedRelation({}, std::move(records));\n"
                "    }}\n\n",
                targetType,
                name);
    }

    m_definitions << std::format("}} // namespace {}\n\n", relation.name);
}

void CxxEntityPrinter::PrintRegisterFunction()
{
    m_definitions << "/// Registers the metadata, key types and relation fetchers of all entities.\n";
    m_definitions << "inline void Register(Refract::EntityRegistry& registry)\n{\n";
    for (auto const& entity: m_entities)
        m_definitions << std::format("    (void) registry.Register({}::Metadata());\n", StructNameOf(entity.name));
    m_definitions << "}\n\n";
}

} // namespace Refract
