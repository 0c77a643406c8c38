// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "AggregateSpec.hpp"
#include "BuilderCore.hpp"
#include "QueryExecutor.hpp"

#include <string>
#include <vector>

class SqlConnection;

namespace Refract
{

class [[nodiscard]] CountQuery final: public WhereListBuilder<CountQuery>, SingleUseQuery
{
  public:
    CountQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_where;
    }

    [[nodiscard]] size_t Exec()
    {
        Consume(m_entity.name);
        return QueryExecutor { m_connection, m_registry }.Count(m_entity, m_where);
    }

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
    std::vector<Predicate> m_where;
};

/// CRTP base of the builders selecting aggregates. The derived class provides Aggregates().
template <typename Derived>
class AggregateSelectionBuilder
{
  public:
    Derived& Count() noexcept
    {
        Aggregates().count = true;
        return self();
    }

    Derived& Sum(std::string field)
    {
        Aggregates().sum.emplace_back(std::move(field));
        return self();
    }

    Derived& Avg(std::string field)
    {
        Aggregates().avg.emplace_back(std::move(field));
        return self();
    }

    Derived& Min(std::string field)
    {
        Aggregates().min.emplace_back(std::move(field));
        return self();
    }

    Derived& Max(std::string field)
    {
        Aggregates().max.emplace_back(std::move(field));
        return self();
    }

  private:
    AggregateSpec& Aggregates() noexcept
    {
        return static_cast<Derived*>(this)->Aggregates();
    }

    Derived& self() noexcept
    {
        return static_cast<Derived&>(*this);
    }
};

class [[nodiscard]] AggregateQuery final:
    public WhereListBuilder<AggregateQuery>,
    public AggregateSelectionBuilder<AggregateQuery>,
    SingleUseQuery
{
  public:
    AggregateQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_where;
    }

    AggregateSpec& Aggregates() noexcept
    {
        return m_aggregates;
    }

    /// @throws QueryValidationError if no aggregate is selected, or a field does not support its aggregate.
    [[nodiscard]] AggregateResult Exec()
    {
        Consume(m_entity.name);
        return QueryExecutor { m_connection, m_registry }.Aggregate(m_entity, m_where, m_aggregates);
    }

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
    std::vector<Predicate> m_where;
    AggregateSpec m_aggregates;
};

class [[nodiscard]] GroupByQuery final:
    public WhereListBuilder<GroupByQuery>,
    public AggregateSelectionBuilder<GroupByQuery>,
    SingleUseQuery
{
  public:
    GroupByQuery(SqlConnection& connection, EntityRegistry const& registry, EntityInfo const& entity) noexcept:
        m_connection { connection },
        m_registry { registry },
        m_entity { entity }
    {
    }

    GroupByQuery& By(std::vector<std::string> fields)
    {
        for (auto& field: fields)
            m_spec.by.emplace_back(std::move(field));
        return *this;
    }

    /// Keeps the groups whose row count compares to the value.
    GroupByQuery& Having(HavingOperator op, size_t value) noexcept
    {
        m_spec.having = HavingCount { .op = op, .value = value };
        return *this;
    }

    GroupByQuery& OrderBy(std::string field, SortOrder order = SortOrder::Asc)
    {
        m_spec.orderBy.push_back(OrderSpec { .field = std::move(field), .order = order, .nulls = NullsOrder::Default });
        return *this;
    }

    GroupByQuery& OrderByCount(SortOrder order) noexcept
    {
        m_spec.orderByCount = order;
        return *this;
    }

    GroupByQuery& Take(size_t count) noexcept
    {
        m_spec.take = count;
        return *this;
    }

    GroupByQuery& Skip(size_t count) noexcept
    {
        m_spec.skip = count;
        return *this;
    }

    std::vector<Predicate>& WhereList() noexcept
    {
        return m_spec.where;
    }

    AggregateSpec& Aggregates() noexcept
    {
        return m_spec.aggregates;
    }

    /// @throws QueryValidationError if no group field is given.
    [[nodiscard]] std::vector<GroupByRow> Exec()
    {
        Consume(m_entity.name);
        return QueryExecutor { m_connection, m_registry }.GroupBy(m_entity, m_spec);
    }

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    EntityInfo const& m_entity;
    GroupBySpec m_spec;
};

} // namespace Refract
