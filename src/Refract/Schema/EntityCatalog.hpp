// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Key/KeyTypeRegistry.hpp"
#include "Entity.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace Refract
{

/// Read-only lookup of entity metadata by name, shared by all queries once populated.
///
/// Names are matched exactly, then unqualified and case-insensitively, so that "blog::User",
/// "User" and "user" all find the same entity.
class REFRACT_API EntityCatalog
{
  public:
    EntityCatalog() = default;
    EntityCatalog(EntityCatalog const&) = delete;
    EntityCatalog& operator=(EntityCatalog const&) = delete;
    EntityCatalog(EntityCatalog&&) noexcept = default;
    EntityCatalog& operator=(EntityCatalog&&) noexcept = default;
    ~EntityCatalog() = default;

    /// Adds the entity and registers its key types. Replaces an entity of the same name.
    EntityInfo const& Add(EntityInfo entity);

    [[nodiscard]] EntityInfo const* Find(std::string_view name) const;

    /// Retrieves the entity by name, or throws QueryValidationError.
    [[nodiscard]] EntityInfo const& Require(std::string_view name) const;

    [[nodiscard]] KeyTypeRegistry const& KeyTypes() const noexcept
    {
        return m_keyTypes;
    }

    [[nodiscard]] size_t Size() const noexcept
    {
        return m_entities.size();
    }

  private:
    // Entities are boxed so that references stay valid while more are added.
    std::map<std::string, std::unique_ptr<EntityInfo>, std::less<>> m_entities;
    std::map<std::string, EntityInfo const*, std::less<>> m_normalizedNames;
    KeyTypeRegistry m_keyTypes;
};

} // namespace Refract
