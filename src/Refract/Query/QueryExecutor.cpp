// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../Predicate/PredicateCompiler.hpp"
#include "../SqlConnection.hpp"
#include "../SqlQuery.hpp"
#include "../SqlStatement.hpp"
#include "QueryExecutor.hpp"
#include "ValueConversion.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace Refract
{

namespace
{

    SqlResultOrdering ToResultOrdering(SortOrder order) noexcept
    {
        return order == SortOrder::Desc ? SqlResultOrdering::DESCENDING : SqlResultOrdering::ASCENDING;
    }

    SqlNullsOrdering ToNullsOrdering(NullsOrder nulls) noexcept
    {
        switch (nulls)
        {
            case NullsOrder::First:
                return SqlNullsOrdering::FIRST;
            case NullsOrder::Last:
                return SqlNullsOrdering::LAST;
            case NullsOrder::Default:
                break;
        }
        return SqlNullsOrdering::DEFAULT;
    }

    /// The ordering the query runs with. Reading from the end runs the ordering backwards.
    std::vector<OrderSpec> EffectiveOrdering(EntityInfo const& entity, ReadSpec const& spec, bool fromEnd)
    {
        auto orders = spec.orderBy;
        if (orders.empty() && (fromEnd || !spec.cursor.empty()))
            orders.push_back(OrderSpec { .field = entity.PrimaryKey().name });

        if (fromEnd)
        {
            for (auto& order: orders)
            {
                order.order = order.order == SortOrder::Asc ? SortOrder::Desc : SortOrder::Asc;
                if (order.nulls == NullsOrder::First)
                    order.nulls = NullsOrder::Last;
                else if (order.nulls == NullsOrder::Last)
                    order.nulls = NullsOrder::First;
            }
        }
        return orders;
    }

    ConditionNode CursorCondition(EntityInfo const& entity,
                                  std::vector<std::pair<std::string, SqlVariant>> const& cursor,
                                  std::vector<OrderSpec> const& orders)
    {
        auto const directionOf = [&](std::string_view fieldName) {
            auto const it = std::ranges::find(orders, fieldName, &OrderSpec::field);
            return it != orders.end() ? it->order : SortOrder::Asc;
        };

        auto bounds = std::vector<std::pair<FieldInfo const*, SqlVariant>> {};
        for (auto const& [fieldName, value]: cursor)
        {
            auto const& field = entity.RequireField(fieldName);
            if (value.IsNull())
                throw QueryValidationError(
                    std::format("Cursor value of field {}.{} must not be NULL", entity.name, field.name));
            bounds.emplace_back(&field, ConvertValue(value, field.type));
        }

        // (c1 > v1) OR (c1 = v1 AND c2 > v2) OR ...
        auto alternatives = std::vector<ConditionNode> {};
        for (size_t i = 0; i < bounds.size(); ++i)
        {
            auto terms = std::vector<ConditionNode> {};
            for (size_t j = 0; j < i; ++j)
                terms.push_back(ConditionNode { ColumnCondition { .table = entity.tableName,
                                                                  .column = bounds[j].first->columnName,
                                                                  .op = FieldOperator::Equals,
                                                                  .values = { bounds[j].second } } });

            auto const op = directionOf(bounds[i].first->name) == SortOrder::Desc ? FieldOperator::LessThan
                                                                                   : FieldOperator::GreaterThan;
            terms.push_back(ConditionNode { ColumnCondition {
                .table = entity.tableName, .column = bounds[i].first->columnName, .op = op, .values = { bounds[i].second } } });

            alternatives.push_back(MakeAll(std::move(terms)));
        }
        return MakeAny(std::move(alternatives));
    }

    /// Columns to read: all columns, or the projection plus the fields needed to link includes and counts.
    std::vector<std::string_view> SelectedColumns(EntityInfo const& entity, ReadSpec const& spec)
    {
        auto columns = std::vector<std::string_view> {};
        if (spec.select.empty())
        {
            for (auto const& field: entity.fields)
                columns.emplace_back(field.columnName);
            return columns;
        }

        auto wanted = std::set<std::string_view> {};
        for (auto const& fieldName: spec.select)
            wanted.insert(entity.RequireField(fieldName).name);
        wanted.insert(entity.PrimaryKey().name);
        for (auto const& include: spec.includes)
            wanted.insert(entity.RequireRelation(include.relation).LocalField());
        for (auto const& relationName: spec.counts)
            wanted.insert(entity.RequireRelation(relationName).LocalField());

        for (auto const& field: entity.fields)
            if (wanted.contains(field.name))
                columns.emplace_back(field.columnName);
        return columns;
    }

    std::optional<size_t> ToLimit(std::optional<int64_t> take) noexcept
    {
        if (!take)
            return std::nullopt;
        if (*take >= 0)
            return static_cast<size_t>(*take);
        // Negating INT64_MIN overflows, so negate one past it instead.
        return static_cast<size_t>(-(*take + 1)) + 1;
    }

} // namespace

std::vector<SqlRecord> ReadEntityRows(SqlStatement& stmt, EntityInfo const& entity)
{
    auto rows = std::vector<SqlRecord> {};
    while (stmt.FetchRow())
    {
        auto const raw = SqlRecord::FromCurrentRow(stmt);
        auto row = SqlRecord {};
        for (auto const& column: raw.Columns())
        {
            if (auto const* field = entity.FindFieldByColumn(column.name); field)
                row.Set(field->name, NormalizeValue(column.value, field->type));
            else
                row.Set(column.name, column.value);
        }
        rows.emplace_back(std::move(row));
    }
    return rows;
}

ConditionNode QueryExecutor::CompileWhere(EntityInfo const& entity, std::vector<Predicate> const& where) const
{
    return PredicateCompiler { m_registry.Catalog() }.Compile(entity, where, entity.tableName);
}

std::string QueryExecutor::Describe(EntityInfo const& entity, std::vector<Predicate> const& where) const
{
    auto bindings = std::vector<SqlVariant> {};
    auto const sql = RenderCondition(CompileWhere(entity, where), m_connection.QueryFormatter(), bindings);
    if (bindings.empty())
        return sql;

    std::string values;
    for (auto const& value: bindings)
    {
        if (!values.empty())
            values += ", ";
        values += value.ToString();
    }
    return std::format("{} [{}]", sql, values);
}

void QueryExecutor::ApplyCondition(SqlSelectQueryBuilder& query, ConditionNode const& condition) const
{
    if (IsTriviallyTrue(condition))
        return;

    auto conditionBindings = std::vector<SqlVariant> {};
    auto const sql = RenderCondition(condition, m_connection.QueryFormatter(), conditionBindings);
    query.Where(sql, std::move(conditionBindings));
}

std::vector<SqlRecord> QueryExecutor::Select(EntityInfo const& entity,
                                             ReadSpec const& spec,
                                             std::vector<ConditionNode> extraConditions) const
{
    bool const fromEnd = spec.take.has_value() && *spec.take < 0;
    auto const orders = EffectiveOrdering(entity, spec, fromEnd);

    auto conditions = std::move(extraConditions);
    conditions.push_back(CompileWhere(entity, spec.where));
    if (!spec.cursor.empty())
        conditions.push_back(CursorCondition(entity, spec.cursor, orders));
    auto const condition = MakeAll(std::move(conditions));

    auto query = m_connection.Query(entity.tableName).Select();
    query.Fields(SelectedColumns(entity, spec), entity.tableName);
    if (spec.distinct)
        query.Distinct();

    ApplyCondition(query, condition);

    for (auto const& order: orders)
    {
        auto const& field = entity.RequireField(order.field);
        query.OrderBy(SqlQualifiedTableColumnName { .tableName = entity.tableName, .columnName = field.columnName },
                      ToResultOrdering(order.order),
                      ToNullsOrdering(order.nulls));
    }

    auto const composed =
        spec.take || spec.skip ? query.Range(spec.skip.value_or(0), ToLimit(spec.take)) : query.All();

    auto stmt = SqlStatement { m_connection };
    stmt.Execute(composed);

    auto rows = ReadEntityRows(stmt, entity);
    if (fromEnd)
        std::ranges::reverse(rows);

    LoadIncludes(entity, rows, spec);
    LoadCounts(entity, rows, spec);
    return rows;
}

void QueryExecutor::LoadIncludes(EntityInfo const& entity, std::vector<SqlRecord>& rows, ReadSpec const& spec) const
{
    for (auto const& include: spec.includes)
    {
        auto const& relation = entity.RequireRelation(include.relation);
        auto const& fetcher = m_registry.Fetcher(relation.targetEntity);

        auto relatedSpec = include.spec;
        if (relation.IsSingle() && !relatedSpec.take)
            relatedSpec.take = 1;

        for (auto& row: rows)
        {
            auto related = std::vector<SqlRecord> {};
            // A NULL foreign key relates to nothing.
            if (auto const value = row.GetOrNull(relation.LocalField()); !value.IsNull())
                related = fetcher.Fetch(m_connection, m_registry, relatedSpec, relation.RemoteColumn(), value);
            row.SetRelation(relation.name, relation.IsSingle(), std::move(related));
        }
    }
}

void QueryExecutor::LoadCounts(EntityInfo const& entity, std::vector<SqlRecord>& rows, ReadSpec const& spec) const
{
    for (auto const& relationName: spec.counts)
    {
        auto const& relation = entity.RequireRelation(relationName);
        auto const& target = m_registry.Entity(relation.targetEntity);
        auto const* remoteField = target.FindFieldByColumn(relation.RemoteColumn());

        for (auto& row: rows)
        {
            auto const value = row.GetOrNull(relation.LocalField());
            if (value.IsNull())
            {
                row.SetCount(relation.name, 0);
                continue;
            }

            auto link = std::vector<ConditionNode> {};
            link.push_back(ConditionNode { ColumnCondition {
                .table = target.tableName,
                .column = relation.RemoteColumn(),
                .op = FieldOperator::Equals,
                .values = { remoteField ? ConvertValue(value, remoteField->type) : value },
            } });
            row.SetCount(relation.name, Count(target, {}, std::move(link)));
        }
    }
}

std::optional<SqlRecord> QueryExecutor::FindUnique(EntityInfo const& entity,
                                                   UniqueSelector const& selector,
                                                   ReadSpec const& spec) const
{
    auto const& field = entity.RequireField(selector.field);
    if (!field.unique)
        throw QueryValidationError(
            std::format("Field {}.{} is not unique and cannot select a single record", entity.name, field.name));

    auto readSpec = spec;
    readSpec.where.push_back(selector.ToPredicate());
    readSpec.take = 1;

    auto rows = Select(entity, readSpec);
    if (rows.empty())
        return std::nullopt;
    return std::move(rows.front());
}

std::optional<SqlRecord> QueryExecutor::FindByColumn(EntityInfo const& entity,
                                                     std::string_view columnName,
                                                     SqlVariant value) const
{
    auto link = std::vector<ConditionNode> {};
    link.push_back(ConditionNode { ColumnCondition {
        .table = entity.tableName,
        .column = std::string(columnName),
        .op = FieldOperator::Equals,
        .values = { std::move(value) },
    } });

    auto rows = Select(entity, ReadSpec { .take = 1 }, std::move(link));
    if (rows.empty())
        return std::nullopt;
    return std::move(rows.front());
}

size_t QueryExecutor::Count(EntityInfo const& entity,
                            std::vector<Predicate> const& where,
                            std::vector<ConditionNode> extraConditions) const
{
    auto conditions = std::move(extraConditions);
    conditions.push_back(CompileWhere(entity, where));
    auto const condition = MakeAll(std::move(conditions));

    auto query = m_connection.Query(entity.tableName).Select();
    ApplyCondition(query, condition);

    auto stmt = SqlStatement { m_connection };
    stmt.Execute(query.Count());

    auto const _ = detail::Finally([&] { stmt.CloseCursor(); });
    if (!stmt.FetchRow())
        return 0;
    return stmt.GetColumn<SqlVariant>(1).TryGetIntegral<size_t>().value_or(0);
}

} // namespace Refract
