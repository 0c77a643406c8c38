// SPDX-License-Identifier: Apache-2.0

#include "../Schema/NameConversion.hpp"
#include "KeyTypeRegistry.hpp"

namespace Refract
{

void KeyTypeRegistry::Register(std::string_view entityName, std::string_view fieldName, FieldType type)
{
    m_types[NormalizeEntityName(entityName)].insert_or_assign(std::string(fieldName), type);
}

void KeyTypeRegistry::Register(EntityInfo const& entity)
{
    auto const& primaryKey = entity.PrimaryKey();
    Register(entity.name, primaryKey.name, primaryKey.type);

    for (auto const& foreignKey: entity.foreignKeys)
        Register(entity.name, foreignKey.fieldName, foreignKey.type);
}

std::optional<FieldType> KeyTypeRegistry::FieldTypeOf(std::string_view entityName, std::string_view fieldName) const
{
    auto const entity = m_types.find(NormalizeEntityName(entityName));
    if (entity == m_types.end())
        return std::nullopt;

    auto const field = entity->second.find(fieldName);
    if (field == entity->second.end())
        return std::nullopt;

    return field->second;
}

SqlVariant KeyTypeRegistry::ConvertKey(EntityKey const& key,
                                       std::string_view entityName,
                                       std::string_view fieldName) const
{
    if (auto const type = FieldTypeOf(entityName, fieldName); type)
        return key.ConvertTo(*type);
    return key.ToSqlVariant();
}

} // namespace Refract
