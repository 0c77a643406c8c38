// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "Entity.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

/// Second pass of the schema compilation: resolves relation targets across all entities.
///
/// Targets may be declared after the referring entity, may be the referring entity itself, or
/// may live outside the current schema. The latter get a table name derived from their name.
class REFRACT_API RelationResolver
{
  public:
    /// Builds the name lookup over the given entities.
    ///
    /// The entities must outlive the resolver.
    explicit RelationResolver(std::vector<EntityInfo> const& entities);

    /// Looks up an entity by name: exact, then without namespace qualifier, then ignoring case.
    [[nodiscard]] EntityInfo const* FindEntity(std::string_view name) const;

    /// Retrieves the table name of an entity, falling back to DefaultTableName() for unknown entities.
    [[nodiscard]] std::string ResolveTableName(std::string_view entityName) const;

    /// Back-fills target tables, foreign key columns and foreign key types of every relation.
    ///
    /// @throws SchemaError if a relation names a foreign key column its owning side does not have.
    void Resolve(std::vector<EntityInfo>& entities) const;

  private:
    void ResolveRelation(EntityInfo& entity, RelationInfo& relation) const;

    std::vector<EntityInfo> const& m_entities;
    std::map<std::string, size_t, std::less<>> m_exactNames;
    std::map<std::string, size_t, std::less<>> m_normalizedNames;
};

} // namespace Refract
