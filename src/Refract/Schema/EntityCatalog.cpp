// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "EntityCatalog.hpp"
#include "NameConversion.hpp"

#include <format>

namespace Refract
{

EntityInfo const& EntityCatalog::Add(EntityInfo entity)
{
    m_keyTypes.Register(entity);

    auto name = entity.name;
    auto& slot = m_entities[name];
    slot = std::make_unique<EntityInfo>(std::move(entity));

    m_normalizedNames.insert_or_assign(NormalizeEntityName(name), slot.get());
    return *slot;
}

EntityInfo const* EntityCatalog::Find(std::string_view name) const
{
    if (auto const it = m_entities.find(name); it != m_entities.end())
        return it->second.get();

    if (auto const it = m_normalizedNames.find(NormalizeEntityName(name)); it != m_normalizedNames.end())
        return it->second;

    return nullptr;
}

EntityInfo const& EntityCatalog::Require(std::string_view name) const
{
    if (auto const* entity = Find(name); entity)
        return *entity;
    throw QueryValidationError(std::format("Unknown entity {}", name));
}

} // namespace Refract
