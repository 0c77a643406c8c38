// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "BuilderCore.hpp"
#include "QueryExecutor.hpp"
#include "ReadSpec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class SqlConnection;

namespace Refract
{

/// CRTP base of the builders accumulating read options.
///
/// The derived class provides Spec(), returning the ReadSpec being built.
template <typename Derived>
class ReadOptionsBuilder: public WhereListBuilder<Derived>
{
  public:
    Derived& OrderBy(std::string field, SortOrder order = SortOrder::Asc, NullsOrder nulls = NullsOrder::Default)
    {
        Spec().orderBy.push_back(OrderSpec { .field = std::move(field), .order = order, .nulls = nulls });
        return self();
    }

    Derived& OrderBy(OrderSpec order)
    {
        Spec().orderBy.push_back(std::move(order));
        return self();
    }

    /// Limits the number of rows. A negative count takes the rows from the end of the ordering.
    Derived& Take(int64_t count) noexcept
    {
        Spec().take = count;
        return self();
    }

    Derived& Skip(size_t count) noexcept
    {
        Spec().skip = count;
        return self();
    }

    /// Starts reading after the row with the given value, in the direction of the ordering.
    ///
    /// Calling it for several fields forms a composite cursor, compared in the order of the calls.
    Derived& Cursor(std::string field, SqlVariant value)
    {
        Spec().cursor.emplace_back(std::move(field), std::move(value));
        return self();
    }

    Derived& Select(std::vector<std::string> fields)
    {
        for (auto& field: fields)
            Spec().select.emplace_back(std::move(field));
        return self();
    }

    Derived& Include(RelationInclude include)
    {
        Spec().includes.emplace_back(std::move(include));
        return self();
    }

    Derived& Include(std::string relation)
    {
        Spec().includes.push_back(RelationInclude { .relation = std::move(relation), .spec = {} });
        return self();
    }

    Derived& IncludeCount(std::string relation)
    {
        Spec().counts.emplace_back(std::move(relation));
        return self();
    }

    Derived& Distinct() noexcept
    {
        Spec().distinct = true;
        return self();
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return Spec().where;
    }

  private:
    ReadSpec& Spec() noexcept
    {
        return static_cast<Derived*>(this)->Spec();
    }

    Derived& self() noexcept
    {
        return static_cast<Derived&>(*this);
    }
};

/// Read options of an included relation, e.g. the three latest posts of each user.
class [[nodiscard]] IncludeBuilder final: public ReadOptionsBuilder<IncludeBuilder>
{
  public:
    explicit IncludeBuilder(std::string relation):
        m_include { .relation = std::move(relation), .spec = {} }
    {
    }

    ReadSpec& Spec() noexcept
    {
        return m_include.spec;
    }

    operator RelationInclude() const
    {
        return m_include;
    }

  private:
    RelationInclude m_include;
};

/// Base of the read builders bound to a connection and an entity.
template <typename Derived>
class EntityReadQuery: public ReadOptionsBuilder<Derived>, protected SingleUseQuery
{
  public:
    EntityReadQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

    ReadSpec& Spec() noexcept
    {
        return m_spec;
    }

    [[nodiscard]] ReadSpec const& Spec() const noexcept
    {
        return m_spec;
    }

  protected:
    [[nodiscard]] QueryExecutor Executor() const noexcept
    {
        return QueryExecutor { m_connection, m_registry };
    }

    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
    ReadSpec m_spec;
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] FindManyQuery final: public EntityReadQuery<FindManyQuery<Record>>
{
  public:
    using EntityReadQuery<FindManyQuery<Record>>::EntityReadQuery;

    [[nodiscard]] std::vector<Record> Exec()
    {
        this->Consume(this->m_entity.name);
        return FromSqlRecords<Record>(this->Executor().Select(this->m_entity, this->m_spec));
    }
};

template <ResultRecord Record = SqlRecord>
class [[nodiscard]] FindFirstQuery final: public EntityReadQuery<FindFirstQuery<Record>>
{
  public:
    using EntityReadQuery<FindFirstQuery<Record>>::EntityReadQuery;

    [[nodiscard]] std::optional<Record> Exec()
    {
        this->Consume(this->m_entity.name);
        auto spec = this->m_spec;
        spec.take = spec.take.value_or(1) < 0 ? -1 : 1;

        auto rows = this->Executor().Select(this->m_entity, spec);
        if (rows.empty())
            return std::nullopt;
        return FromSqlRecord<Record>(std::move(rows.front()));
    }
};

/// Reads the row selected by a unique field. Further where predicates narrow the match.
template <ResultRecord Record = SqlRecord>
class [[nodiscard]] FindUniqueQuery final: public EntityReadQuery<FindUniqueQuery<Record>>
{
  public:
    FindUniqueQuery(SqlConnection& connection,
                    EntityRegistry const& registry,
                    EntityInfo const& entity,
                    UniqueSelector selector):
        EntityReadQuery<FindUniqueQuery<Record>> { connection, registry, entity },
        m_selector { std::move(selector) }
    {
    }

    [[nodiscard]] std::optional<Record> Exec()
    {
        this->Consume(this->m_entity.name);
        auto row = this->Executor().FindUnique(this->m_entity, m_selector, this->m_spec);
        if (!row)
            return std::nullopt;
        return FromSqlRecord<Record>(std::move(*row));
    }

  private:
    UniqueSelector m_selector;
};

} // namespace Refract
