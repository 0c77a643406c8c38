// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Query/AggregateQuery.hpp"
#include "Query/Batch.hpp"
#include "Query/RawQuery.hpp"
#include "Query/ReadQuery.hpp"
#include "Query/WriteQuery.hpp"

#include <string_view>
#include <vector>

class SqlConnection;

namespace Refract
{

/// Entry point to the reads and writes of one entity.
///
/// Every method starts a new single-use builder, executed by calling its Exec().
template <ResultRecord Record = SqlRecord>
class EntityClient
{
  public:
    EntityClient(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

    [[nodiscard]] EntityInfo const& Metadata() const noexcept
    {
        return m_entity;
    }

    [[nodiscard]] FindUniqueQuery<Record> FindUnique(UniqueSelector selector) const
    {
        return { m_connection, m_registry, m_entity, std::move(selector) };
    }

    [[nodiscard]] FindFirstQuery<Record> FindFirst() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] FindManyQuery<Record> FindMany() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] CreateQuery<Record> Create() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] CreateQuery<Record> Create(Record const& record) const
    {
        auto query = CreateQuery<Record> { m_connection, m_registry, m_entity };
        query.Data(record);
        return query;
    }

    [[nodiscard]] UpdateQuery<Record> Update() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] DeleteQuery<Record> Delete() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] UpsertQuery<Record> Upsert() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] CreateManyQuery<Record> CreateMany() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] UpdateManyQuery UpdateMany() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] DeleteManyQuery DeleteMany() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] CountQuery Count() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] AggregateQuery Aggregate() const
    {
        return { m_connection, m_registry, m_entity };
    }

    [[nodiscard]] GroupByQuery GroupBy() const
    {
        return { m_connection, m_registry, m_entity };
    }

    /// Loads the rows related to the given row through the relation.
    ///
    /// @throws RelationNotFoundError if the entity has no such relation.
    [[nodiscard]] std::vector<SqlRecord> FetchRelated(Record const& record,
                                                      std::string_view relationName,
                                                      ReadSpec const& spec = {}) const
    {
        auto const& relation = m_entity.RequireRelation(relationName);
        auto const value = ToSqlRecord(record).GetOrNull(relation.LocalField());
        if (value.IsNull())
            return {};

        auto relatedSpec = spec;
        if (relation.IsSingle() && !relatedSpec.take)
            relatedSpec.take = 1;
        return m_registry.Fetcher(relation.targetEntity)
            .Fetch(m_connection, m_registry, relatedSpec, relation.RemoteColumn(), value);
    }

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
};

/// Binds a connection to a registry, handing out entity clients, batches and raw statements.
class Client
{
  public:
    Client(SqlConnection& connection, EntityRegistry const& registry) noexcept:
        m_connection { connection },
        m_registry { registry }
    {
    }

    /// The client of a generated entity type.
    template <EntityRecord Record>
    [[nodiscard]] EntityClient<Record> Entity() const
    {
        return { m_connection, m_registry, m_registry.Entity(Record::Metadata().name) };
    }

    /// The untyped client of an entity, looked up by name.
    ///
    /// @throws QueryValidationError if the registry has no such entity.
    [[nodiscard]] EntityClient<SqlRecord> Entity(std::string_view entityName) const
    {
        return { m_connection, m_registry, m_registry.Entity(entityName) };
    }

    [[nodiscard]] Batch NewBatch() const
    {
        return Batch { m_connection, m_registry };
    }

    [[nodiscard]] std::vector<SqlRecord> ExecuteRaw(std::string_view sql,
                                                    std::vector<SqlVariant> const& parameters = {}) const
    {
        return Refract::ExecuteRaw(m_connection, sql, parameters);
    }

    size_t ExecuteRawStatement(std::string_view sql, std::vector<SqlVariant> const& parameters = {}) const
    {
        return Refract::ExecuteRawStatement(m_connection, sql, parameters);
    }

    [[nodiscard]] SqlConnection& Connection() const noexcept
    {
        return m_connection;
    }

    [[nodiscard]] EntityRegistry const& Registry() const noexcept
    {
        return m_registry;
    }

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
};

} // namespace Refract
