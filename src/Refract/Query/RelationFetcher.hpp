// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/Entity.hpp"
#include "ReadSpec.hpp"
#include "SqlRecord.hpp"

#include <string_view>
#include <vector>

class SqlConnection;

namespace Refract
{

class EntityRegistry;

/// Loads the rows of one entity related to a parent row, without the caller knowing the entity's type.
class REFRACT_API RelationFetcher
{
  public:
    RelationFetcher() = default;
    RelationFetcher(RelationFetcher const&) = delete;
    RelationFetcher& operator=(RelationFetcher const&) = delete;
    RelationFetcher(RelationFetcher&&) = delete;
    RelationFetcher& operator=(RelationFetcher&&) = delete;
    virtual ~RelationFetcher() = default;

    /// Fetches the rows whose column equals the given value, applying the read options.
    [[nodiscard]] virtual std::vector<SqlRecord> Fetch(SqlConnection& connection,
                                                       EntityRegistry const& registry,
                                                       ReadSpec const& spec,
                                                       std::string_view columnName,
                                                       SqlVariant const& value) const = 0;
};

/// Fetches related rows through the query executor, using the entity's metadata.
class REFRACT_API GenericRelationFetcher final: public RelationFetcher
{
  public:
    explicit GenericRelationFetcher(EntityInfo const& entity) noexcept:
        m_entity { entity }
    {
    }

    [[nodiscard]] std::vector<SqlRecord> Fetch(SqlConnection& connection,
                                               EntityRegistry const& registry,
                                               ReadSpec const& spec,
                                               std::string_view columnName,
                                               SqlVariant const& value) const override;

  private:
    EntityInfo const& m_entity;
};

} // namespace Refract
