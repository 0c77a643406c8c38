// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "NameConversion.hpp"
#include "RelationResolver.hpp"

#include <algorithm>
#include <format>

namespace Refract
{

RelationResolver::RelationResolver(std::vector<EntityInfo> const& entities):
    m_entities { entities }
{
    for (size_t i = 0; i < entities.size(); ++i)
    {
        m_exactNames.try_emplace(entities[i].name, i);
        m_normalizedNames.try_emplace(NormalizeEntityName(entities[i].name), i);
    }
}

EntityInfo const* RelationResolver::FindEntity(std::string_view name) const
{
    if (auto const it = m_exactNames.find(name); it != m_exactNames.end())
        return &m_entities[it->second];

    auto const unqualified = LastPathSegment(name);
    if (auto const it = std::ranges::find(m_entities, unqualified, [](EntityInfo const& entity) {
            return LastPathSegment(entity.name);
        });
        it != m_entities.end())
        return &*it;

    if (auto const it = m_normalizedNames.find(NormalizeEntityName(name)); it != m_normalizedNames.end())
        return &m_entities[it->second];

    return nullptr;
}

std::string RelationResolver::ResolveTableName(std::string_view entityName) const
{
    if (auto const* entity = FindEntity(entityName); entity)
        return entity->tableName;
    return DefaultTableName(entityName);
}

void RelationResolver::ResolveRelation(EntityInfo& entity, RelationInfo& relation) const
{
    auto const* target = FindEntity(relation.targetEntity);
    relation.targetTable = target ? target->tableName : DefaultTableName(relation.targetEntity);

    // The side that carries the foreign key column, and the side it points to.
    EntityInfo const* owner = relation.OwnsForeignKey() ? &entity : target;
    EntityInfo const* referenced = relation.OwnsForeignKey() ? target : &entity;

    if (owner)
    {
        auto const* foreignKey = owner->FindField(relation.foreignKeyField);
        if (!foreignKey)
            throw SchemaError(entity.name,
                              std::format("relation {} refers to missing foreign key column {}.{}",
                                          relation.name,
                                          owner->name,
                                          relation.foreignKeyField));
        relation.foreignKeyColumn = foreignKey->columnName;
        relation.foreignKeyType = foreignKey->type;
        relation.foreignKeyNullable = foreignKey->nullable;
    }
    else
        relation.foreignKeyColumn = relation.foreignKeyField;

    if (referenced)
    {
        if (relation.referencedField.empty())
            relation.referencedField = referenced->PrimaryKey().name;

        auto const* referencedField = referenced->FindField(relation.referencedField);
        if (!referencedField)
            throw SchemaError(entity.name,
                              std::format("relation {} refers to missing column {}.{}",
                                          relation.name,
                                          referenced->name,
                                          relation.referencedField));
        relation.referencedColumn = referencedField->columnName;

        // An external owner leaves the type open; the referenced key has the same type.
        if (!relation.foreignKeyType)
            relation.foreignKeyType = referencedField->type;
    }
    else
    {
        if (relation.referencedField.empty())
            relation.referencedField = "id";
        relation.referencedColumn = relation.referencedField;
    }
}

void RelationResolver::Resolve(std::vector<EntityInfo>& entities) const
{
    for (auto& entity: entities)
    {
        for (auto& relation: entity.relations)
            ResolveRelation(entity, relation);

        for (auto const& relation: entity.relations)
        {
            if (!relation.OwnsForeignKey() || !relation.foreignKeyType)
                continue;
            if (!std::ranges::contains(entity.foreignKeys, relation.foreignKeyField, &ForeignKeyInfo::fieldName))
                entity.foreignKeys.emplace_back(
                    ForeignKeyInfo { .fieldName = relation.foreignKeyField, .type = *relation.foreignKeyType });
        }
    }
}

} // namespace Refract
