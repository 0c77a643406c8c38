// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "BuilderCore.hpp"
#include "WriteExecutor.hpp"
#include "WriteOperation.hpp"

#include <string>
#include <utility>
#include <vector>

class SqlConnection;

namespace Refract
{

/// Links existing rows to the written row.
[[nodiscard]] inline RelationMutation ConnectRelation(std::string relation, std::vector<UniqueSelector> selectors)
{
    return RelationMutation { .relation = std::move(relation),
                              .kind = RelationMutationKind::Connect,
                              .selectors = std::move(selectors),
                              .rows = {} };
}

/// Unlinks the row related through a BelongsTo relation, clearing its foreign key.
[[nodiscard]] inline RelationMutation DisconnectRelation(std::string relation)
{
    return RelationMutation {
        .relation = std::move(relation), .kind = RelationMutationKind::Disconnect, .selectors = {}, .rows = {}
    };
}

/// Makes the selected rows the exact set of rows related through a HasMany relation.
[[nodiscard]] inline RelationMutation SetRelation(std::string relation, std::vector<UniqueSelector> selectors)
{
    return RelationMutation { .relation = std::move(relation),
                              .kind = RelationMutationKind::Set,
                              .selectors = std::move(selectors),
                              .rows = {} };
}

[[nodiscard]] inline RelationMutation CreateNestedRelation(std::string relation, std::vector<SqlRecord> rows)
{
    return RelationMutation { .relation = std::move(relation),
                              .kind = RelationMutationKind::CreateNested,
                              .selectors = {},
                              .rows = std::move(rows) };
}

/// Base of the write builders bound to a connection and an entity.
class EntityWriteQuery: protected SingleUseQuery
{
  public:
    EntityWriteQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

  protected:
    [[nodiscard]] WriteExecutor Executor() const noexcept
    {
        return WriteExecutor { m_connection, m_registry };
    }

    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] CreateQuery final: public EntityWriteQuery
{
  public:
    CreateQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity):
        EntityWriteQuery { connection, registry, entity },
        m_operation { .entity = entity.name, .data = {}, .relations = {} }
    {
    }

    CreateQuery& Set(std::string_view field, SqlVariant value)
    {
        m_operation.data.Set(field, std::move(value));
        return *this;
    }

    /// Takes all fields of the given record. Fields set before are overwritten.
    CreateQuery& Data(Record const& record)
    {
        for (auto const& [name, value]: ToSqlRecord(record).Columns())
            m_operation.data.Set(name, value);
        return *this;
    }

    CreateQuery& With(RelationMutation mutation)
    {
        m_operation.relations.emplace_back(std::move(mutation));
        return *this;
    }

    [[nodiscard]] CreateOperation const& Operation() const noexcept
    {
        return m_operation;
    }

    Record Exec()
    {
        Consume(m_entity.name);
        return FromSqlRecord<Record>(Executor().Create(m_operation));
    }

  private:
    CreateOperation m_operation;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] UpdateQuery final: public EntityWriteQuery, public WhereListBuilder<UpdateQuery<Record>>
{
  public:
    UpdateQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity):
        EntityWriteQuery { connection, registry, entity },
        m_operation { .entity = entity.name, .where = {}, .mutations = {}, .relations = {} }
    {
    }

    UpdateQuery& Mutate(FieldMutation mutation)
    {
        m_operation.mutations.emplace_back(std::move(mutation));
        return *this;
    }

    UpdateQuery& Data(std::vector<FieldMutation> mutations)
    {
        for (auto& mutation: mutations)
            m_operation.mutations.emplace_back(std::move(mutation));
        return *this;
    }

    UpdateQuery& With(RelationMutation mutation)
    {
        m_operation.relations.emplace_back(std::move(mutation));
        return *this;
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_operation.where;
    }

    [[nodiscard]] UpdateOperation const& Operation() const noexcept
    {
        return m_operation;
    }

    /// @throws RecordNotFoundError if no row matches.
    Record Exec()
    {
        Consume(m_entity.name);
        return FromSqlRecord<Record>(Executor().Update(m_operation));
    }

  private:
    UpdateOperation m_operation;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] DeleteQuery final: public EntityWriteQuery, public WhereListBuilder<DeleteQuery<Record>>
{
  public:
    DeleteQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity):
        EntityWriteQuery { connection, registry, entity },
        m_operation { .entity = entity.name, .where = {} }
    {
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_operation.where;
    }

    [[nodiscard]] DeleteOperation const& Operation() const noexcept
    {
        return m_operation;
    }

    /// Deletes the first matching row and returns it as it was before.
    ///
    /// @throws RecordNotFoundError if no row matches.
    Record Exec()
    {
        Consume(m_entity.name);
        return FromSqlRecord<Record>(Executor().Delete(m_operation));
    }

  private:
    DeleteOperation m_operation;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] UpsertQuery final: public EntityWriteQuery, public WhereListBuilder<UpsertQuery<Record>>
{
  public:
    UpsertQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity):
        EntityWriteQuery { connection, registry, entity },
        m_operation { .entity = entity.name, .where = {}, .create = {}, .update = {} }
    {
    }

    /// The row inserted if none matches.
    UpsertQuery& Create(Record const& record)
    {
        m_operation.create = ToSqlRecord(record);
        return *this;
    }

    /// The mutations applied to the matching row.
    UpsertQuery& Update(std::vector<FieldMutation> mutations)
    {
        for (auto& mutation: mutations)
            m_operation.update.emplace_back(std::move(mutation));
        return *this;
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_operation.where;
    }

    [[nodiscard]] UpsertOperation const& Operation() const noexcept
    {
        return m_operation;
    }

    Record Exec()
    {
        Consume(m_entity.name);
        return FromSqlRecord<Record>(Executor().Upsert(m_operation));
    }

  private:
    UpsertOperation m_operation;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] CreateManyQuery final: public EntityWriteQuery
{
  public:
    using EntityWriteQuery::EntityWriteQuery;

    CreateManyQuery& Data(std::vector<Record> const& records)
    {
        for (auto const& record: records)
            m_rows.emplace_back(ToSqlRecord(record));
        return *this;
    }

    CreateManyQuery& Add(Record const& record)
    {
        m_rows.emplace_back(ToSqlRecord(record));
        return *this;
    }

    /// Inserts all rows in one transaction and returns their number.
    size_t Exec()
    {
        Consume(m_entity.name);
        return Executor().CreateMany(m_entity.name, m_rows);
    }

  private:
    std::vector<SqlRecord> m_rows;
};

class [[nodiscard]] UpdateManyQuery final: public EntityWriteQuery, public WhereListBuilder<UpdateManyQuery>
{
  public:
    using EntityWriteQuery::EntityWriteQuery;

    UpdateManyQuery& Mutate(FieldMutation mutation)
    {
        m_mutations.emplace_back(std::move(mutation));
        return *this;
    }

    UpdateManyQuery& Data(std::vector<FieldMutation> mutations)
    {
        for (auto& mutation: mutations)
            m_mutations.emplace_back(std::move(mutation));
        return *this;
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_where;
    }

    /// Returns the number of matching rows.
    size_t Exec()
    {
        Consume(m_entity.name);
        return Executor().UpdateMany(m_entity.name, m_where, m_mutations);
    }

  private:
    std::vector<Predicate> m_where;
    std::vector<FieldMutation> m_mutations;
};

class [[nodiscard]] DeleteManyQuery final: public EntityWriteQuery, public WhereListBuilder<DeleteManyQuery>
{
  public:
    using EntityWriteQuery::EntityWriteQuery;

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_where;
    }

    size_t Exec()
    {
        Consume(m_entity.name);
        return Executor().DeleteMany(m_entity.name, m_where);
    }

  private:
    std::vector<Predicate> m_where;
};

} // namespace Refract
