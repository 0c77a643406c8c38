// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../Schema/NameConversion.hpp"
#include "EntityRegistry.hpp"

namespace Refract
{

EntityInfo const& EntityRegistry::Register(EntityInfo entity)
{
    auto const& registered = m_catalog.Add(std::move(entity));
    m_fetchers.insert_or_assign(NormalizeEntityName(registered.name),
                                std::make_unique<GenericRelationFetcher>(registered));
    return registered;
}

EntityInfo const& EntityRegistry::Register(EntityInfo entity, std::unique_ptr<RelationFetcher> fetcher)
{
    auto const& registered = m_catalog.Add(std::move(entity));
    if (fetcher)
        m_fetchers.insert_or_assign(NormalizeEntityName(registered.name), std::move(fetcher));
    else
        m_fetchers.insert_or_assign(NormalizeEntityName(registered.name),
                                    std::make_unique<GenericRelationFetcher>(registered));
    return registered;
}

RelationFetcher const& EntityRegistry::Fetcher(std::string_view entityName) const
{
    if (auto const it = m_fetchers.find(NormalizeEntityName(entityName)); it != m_fetchers.end())
        return *it->second;
    throw FetcherMissingError(entityName);
}

} // namespace Refract
