// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "QueryExecutor.hpp"
#include "WriteOperation.hpp"

#include <string_view>
#include <utility>
#include <vector>

class SqlConnection;

namespace Refract
{

/// Runs writes of entity rows on one connection.
///
/// Every write runs in a transaction that is rolled back unless the write completes, joining the
/// caller's transaction if one is active. Single-row writes return the row as stored afterwards.
class REFRACT_API WriteExecutor
{
  public:
    WriteExecutor(SqlConnection& connection, EntityRegistry const& registry) noexcept:
        m_reader { connection, registry }
    {
    }

    /// Inserts a row, resolving connected rows first and creating nested rows afterwards.
    ///
    /// @throws RecordNotFoundError if a connected row does not exist.
    SqlRecord Create(CreateOperation const& operation);

    /// Applies the mutations to the first row matching the where-list.
    ///
    /// @throws RecordNotFoundError if no row matches.
    SqlRecord Update(UpdateOperation const& operation);

    /// @throws RecordNotFoundError if no row matches.
    SqlRecord Delete(DeleteOperation const& operation);

    SqlRecord Upsert(UpsertOperation const& operation);

    /// Runs any of the operations above, returning its kind along with the row.
    std::pair<WriteKind, SqlRecord> Execute(WriteOperation const& operation);

    size_t CreateMany(std::string_view entityName, std::vector<SqlRecord> const& rows);

    /// Applies the mutations to all matching rows in one statement.
    size_t UpdateMany(std::string_view entityName,
                      std::vector<Predicate> const& where,
                      std::vector<FieldMutation> const& mutations);

    size_t DeleteMany(std::string_view entityName, std::vector<Predicate> const& where);

  private:
    using Assignments = std::vector<std::pair<std::string, SqlVariant>>;

    SqlConnection& Connection() const noexcept
    {
        return m_reader.Connection();
    }

    EntityRegistry const& Registry() const noexcept
    {
        return m_reader.Registry();
    }

    SqlVariant InsertRow(EntityInfo const& entity, SqlRecord const& data);
    SqlRecord RequireExisting(EntityInfo const& entity, std::vector<Predicate> const& where) const;
    SqlRecord RequireRelated(EntityInfo const& target, UniqueSelector const& selector) const;
    void RunDeferredLookups(std::vector<DeferredLookup> const& lookups) const;
    DeferredLookup MakeConnectLookup(EntityInfo const& entity,
                                     RelationInfo const& relation,
                                     UniqueSelector const& selector,
                                     SqlRecord& row) const;
    static void ApplyFieldMutations(EntityInfo const& entity,
                                    SqlRecord& row,
                                    std::vector<FieldMutation> const& mutations);
    void ApplyRelatedRowMutation(EntityInfo const& entity,
                                 SqlRecord const& parent,
                                 RelationInfo const& relation,
                                 RelationMutation const& mutation);
    size_t UpdateRows(EntityInfo const& entity, Assignments const& assignments, ConditionNode const& condition);
    size_t DeleteRows(EntityInfo const& entity, ConditionNode const& condition);
    SqlRecord Refetch(EntityInfo const& entity, SqlVariant const& primaryKey) const;

    QueryExecutor m_reader;
};

} // namespace Refract
