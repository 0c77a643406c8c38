// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Predicate/ConditionTree.hpp"
#include "../Predicate/Predicate.hpp"
#include "../Schema/Entity.hpp"
#include "AggregateSpec.hpp"
#include "EntityRegistry.hpp"
#include "ReadSpec.hpp"
#include "SqlRecord.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

class SqlConnection;
class SqlSelectQueryBuilder;
class SqlStatement;

namespace Refract
{

/// Runs reads of entity rows on one connection.
///
/// Records are keyed by field name, and their values are converted into the field types.
class REFRACT_API QueryExecutor
{
  public:
    QueryExecutor(SqlConnection& connection, EntityRegistry const& registry) noexcept:
        m_connection { connection },
        m_registry { registry }
    {
    }

    /// Reads the rows matching the read options and the additional conditions, then loads their includes.
    [[nodiscard]] std::vector<SqlRecord> Select(EntityInfo const& entity,
                                                ReadSpec const& spec,
                                                std::vector<ConditionNode> extraConditions = {}) const;

    /// Reads the row selected by a unique field.
    ///
    /// @throws QueryValidationError if the selector's field is not unique.
    [[nodiscard]] std::optional<SqlRecord> FindUnique(EntityInfo const& entity,
                                                      UniqueSelector const& selector,
                                                      ReadSpec const& spec = {}) const;

    /// Reads the first row whose column equals the value.
    [[nodiscard]] std::optional<SqlRecord> FindByColumn(EntityInfo const& entity,
                                                        std::string_view columnName,
                                                        SqlVariant value) const;

    [[nodiscard]] size_t Count(EntityInfo const& entity,
                               std::vector<Predicate> const& where,
                               std::vector<ConditionNode> extraConditions = {}) const;

    [[nodiscard]] AggregateResult Aggregate(EntityInfo const& entity,
                                            std::vector<Predicate> const& where,
                                            AggregateSpec const& aggregates) const;

    [[nodiscard]] std::vector<GroupByRow> GroupBy(EntityInfo const& entity, GroupBySpec const& spec) const;

    /// Compiles a where-list against the entity's table.
    [[nodiscard]] ConditionNode CompileWhere(EntityInfo const& entity, std::vector<Predicate> const& where) const;

    /// Renders a where-list with its bound values, for diagnostics.
    [[nodiscard]] std::string Describe(EntityInfo const& entity, std::vector<Predicate> const& where) const;

    [[nodiscard]] SqlConnection& Connection() const noexcept
    {
        return m_connection;
    }

    [[nodiscard]] EntityRegistry const& Registry() const noexcept
    {
        return m_registry;
    }

  private:
    void ApplyCondition(SqlSelectQueryBuilder& query, ConditionNode const& condition) const;
    void LoadIncludes(EntityInfo const& entity, std::vector<SqlRecord>& rows, ReadSpec const& spec) const;
    void LoadCounts(EntityInfo const& entity, std::vector<SqlRecord>& rows, ReadSpec const& spec) const;

    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
};

/// Reads all remaining rows of the statement, keyed by field name where the column belongs to the entity.
[[nodiscard]] REFRACT_API std::vector<SqlRecord> ReadEntityRows(SqlStatement& stmt, EntityInfo const& entity);

} // namespace Refract
