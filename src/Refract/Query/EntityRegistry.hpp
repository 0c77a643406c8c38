// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/EntityCatalog.hpp"
#include "RelationFetcher.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace Refract
{

/// The composite registry a running application queries: entity metadata, key types and relation fetchers.
///
/// Populated once (usually by the generated Register function) and read-only afterwards, so that
/// it can be shared between threads.
class REFRACT_API EntityRegistry
{
  public:
    EntityRegistry() = default;
    EntityRegistry(EntityRegistry const&) = delete;
    EntityRegistry& operator=(EntityRegistry const&) = delete;
    EntityRegistry(EntityRegistry&&) noexcept = default;
    EntityRegistry& operator=(EntityRegistry&&) noexcept = default;
    ~EntityRegistry() = default;

    /// Registers the entity with a fetcher going through its metadata.
    EntityInfo const& Register(EntityInfo entity);

    /// Registers the entity with a custom fetcher.
    EntityInfo const& Register(EntityInfo entity, std::unique_ptr<RelationFetcher> fetcher);

    [[nodiscard]] EntityCatalog const& Catalog() const noexcept
    {
        return m_catalog;
    }

    [[nodiscard]] KeyTypeRegistry const& KeyTypes() const noexcept
    {
        return m_catalog.KeyTypes();
    }

    [[nodiscard]] EntityInfo const& Entity(std::string_view name) const
    {
        return m_catalog.Require(name);
    }

    /// Retrieves the fetcher of the entity, or throws FetcherMissingError.
    ///
    /// The name is matched unqualified and case-insensitively.
    [[nodiscard]] RelationFetcher const& Fetcher(std::string_view entityName) const;

  private:
    EntityCatalog m_catalog;
    std::map<std::string, std::unique_ptr<RelationFetcher>, std::less<>> m_fetchers;
};

} // namespace Refract
