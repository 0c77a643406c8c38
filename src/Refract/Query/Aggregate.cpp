// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../SqlConnection.hpp"
#include "../SqlQuery.hpp"
#include "../SqlStatement.hpp"
#include "QueryExecutor.hpp"
#include "ValueConversion.hpp"

#include <format>

namespace Refract
{

namespace
{

    enum class AggregateFunction : uint8_t
    {
        Sum,
        Avg,
        Min,
        Max,
    };

    std::string_view FunctionName(AggregateFunction function) noexcept
    {
        switch (function)
        {
            case AggregateFunction::Sum:
                return "SUM";
            case AggregateFunction::Avg:
                return "AVG";
            case AggregateFunction::Min:
                return "MIN";
            case AggregateFunction::Max:
                return "MAX";
        }
        return "COUNT";
    }

    std::string AliasOf(AggregateFunction function, std::string_view fieldName)
    {
        switch (function)
        {
            case AggregateFunction::Sum:
                return std::format("_sum_{}", fieldName);
            case AggregateFunction::Avg:
                return std::format("_avg_{}", fieldName);
            case AggregateFunction::Min:
                return std::format("_min_{}", fieldName);
            case AggregateFunction::Max:
                return std::format("_max_{}", fieldName);
        }
        return std::string(fieldName);
    }

    constexpr auto CountAlias = std::string_view { "_count" };

    bool IsAggregatable(FieldInfo const& field, AggregateFunction function) noexcept
    {
        auto const typeClass = ClassOf(field.type);
        switch (function)
        {
            case AggregateFunction::Sum:
            case AggregateFunction::Avg:
                return typeClass == TypeClass::Numeric;
            case AggregateFunction::Min:
            case AggregateFunction::Max:
                return typeClass == TypeClass::Numeric || typeClass == TypeClass::String
                       || typeClass == TypeClass::Temporal;
        }
        return false;
    }

    template <typename Callback>
    void ForEachAggregate(AggregateSpec const& spec, Callback const& callback)
    {
        for (auto const& fieldName: spec.sum)
            callback(AggregateFunction::Sum, fieldName);
        for (auto const& fieldName: spec.avg)
            callback(AggregateFunction::Avg, fieldName);
        for (auto const& fieldName: spec.min)
            callback(AggregateFunction::Min, fieldName);
        for (auto const& fieldName: spec.max)
            callback(AggregateFunction::Max, fieldName);
    }

    void AddAggregateFields(EntityInfo const& entity, SqlSelectQueryBuilder& query, AggregateSpec const& spec)
    {
        if (spec.count)
            query.FieldExpressionAs("COUNT(*)", CountAlias);

        ForEachAggregate(spec, [&](AggregateFunction function, std::string const& fieldName) {
            auto const& field = entity.RequireField(fieldName);
            if (!IsAggregatable(field, function))
                throw QueryValidationError(std::format("Cannot compute {} of field {}.{} of type {}",
                                                       FunctionName(function),
                                                       entity.name,
                                                       field.name,
                                                       field.type));

            auto const column = ::detail::MakeSqlColumnName(
                SqlQualifiedTableColumnName { .tableName = entity.tableName, .columnName = field.columnName });
            query.FieldExpressionAs(std::format("{}({})", FunctionName(function), column),
                                    AliasOf(function, field.name));
        });
    }

    SqlVariant AggregateValue(FieldInfo const& field, AggregateFunction function, SqlVariant value)
    {
        if (value.IsNull())
            return value;

        switch (function)
        {
            case AggregateFunction::Sum:
                return NormalizeValue(std::move(value), IsFloatingPoint(field.type) ? FieldType::Float64 : FieldType::Int64);
            case AggregateFunction::Avg:
                return NormalizeValue(std::move(value), FieldType::Float64);
            case AggregateFunction::Min:
            case AggregateFunction::Max:
                return NormalizeValue(std::move(value), field.type);
        }
        return value;
    }

    AggregateResult ParseAggregates(EntityInfo const& entity, SqlRecord const& raw, AggregateSpec const& spec)
    {
        auto result = AggregateResult {};
        if (spec.count)
            result.count = raw.GetOrNull(CountAlias).TryGetIntegral<size_t>().value_or(0);

        ForEachAggregate(spec, [&](AggregateFunction function, std::string const& fieldName) {
            auto const& field = entity.RequireField(fieldName);
            auto value = AggregateValue(field, function, raw.GetOrNull(AliasOf(function, field.name)));
            switch (function)
            {
                case AggregateFunction::Sum:
                    result.sum.insert_or_assign(field.name, std::move(value));
                    break;
                case AggregateFunction::Avg:
                    result.avg.insert_or_assign(field.name, std::move(value));
                    break;
                case AggregateFunction::Min:
                    result.min.insert_or_assign(field.name, std::move(value));
                    break;
                case AggregateFunction::Max:
                    result.max.insert_or_assign(field.name, std::move(value));
                    break;
            }
        });
        return result;
    }

    std::string_view HavingOperatorText(HavingOperator op) noexcept
    {
        switch (op)
        {
            case HavingOperator::Equals:
                return "=";
            case HavingOperator::GreaterThan:
                return ">";
            case HavingOperator::LessThan:
                return "<";
        }
        return "=";
    }

} // namespace

AggregateResult QueryExecutor::Aggregate(EntityInfo const& entity,
                                         std::vector<Predicate> const& where,
                                         AggregateSpec const& aggregates) const
{
    if (aggregates.Empty())
        throw QueryValidationError(std::format("Aggregate on {} without any aggregate function", entity.name));

    auto query = m_connection.Query(entity.tableName).Select();
    AddAggregateFields(entity, query, aggregates);
    ApplyCondition(query, CompileWhere(entity, where));

    auto stmt = SqlStatement { m_connection };
    stmt.Execute(query.All());

    auto const _ = detail::Finally([&] { stmt.CloseCursor(); });
    if (!stmt.FetchRow())
        return ParseAggregates(entity, SqlRecord {}, aggregates);
    return ParseAggregates(entity, SqlRecord::FromCurrentRow(stmt), aggregates);
}

std::vector<GroupByRow> QueryExecutor::GroupBy(EntityInfo const& entity, GroupBySpec const& spec) const
{
    if (spec.by.empty())
        throw QueryValidationError(std::format("GroupBy on {} without any group field", entity.name));

    auto groupFields = std::vector<FieldInfo const*> {};
    for (auto const& fieldName: spec.by)
        groupFields.push_back(&entity.RequireField(fieldName));

    auto query = m_connection.Query(entity.tableName).Select();
    for (auto const* field: groupFields)
        query.Field(SqlQualifiedTableColumnName { .tableName = entity.tableName, .columnName = field->columnName });
    AddAggregateFields(entity, query, spec.aggregates);
    ApplyCondition(query, CompileWhere(entity, spec.where));

    for (auto const* field: groupFields)
        query.GroupBy(field->columnName);

    if (spec.having)
        query.Having(std::format("COUNT(*) {} {}", HavingOperatorText(spec.having->op), spec.having->value));

    for (auto const& order: spec.orderBy)
    {
        auto const& field = entity.RequireField(order.field);
        if (std::ranges::find(spec.by, field.name) == spec.by.end())
            throw QueryValidationError(
                std::format("Cannot order groups of {} by {}, which is not a group field", entity.name, field.name));
        query.OrderBy(SqlQualifiedTableColumnName { .tableName = entity.tableName, .columnName = field.columnName },
                      order.order == SortOrder::Desc ? SqlResultOrdering::DESCENDING : SqlResultOrdering::ASCENDING);
    }
    if (spec.orderByCount)
        query.OrderByExpression("COUNT(*)",
                                *spec.orderByCount == SortOrder::Desc ? SqlResultOrdering::DESCENDING
                                                                      : SqlResultOrdering::ASCENDING);

    auto const composed = spec.take || spec.skip ? query.Range(spec.skip.value_or(0), spec.take) : query.All();

    auto stmt = SqlStatement { m_connection };
    stmt.Execute(composed);

    auto result = std::vector<GroupByRow> {};
    while (stmt.FetchRow())
    {
        auto const raw = SqlRecord::FromCurrentRow(stmt);
        auto row = GroupByRow {};
        for (auto const* field: groupFields)
            row.group.Set(field->name, NormalizeValue(raw.GetOrNull(field->columnName), field->type));
        row.aggregates = ParseAggregates(entity, raw, spec.aggregates);
        result.emplace_back(std::move(row));
    }
    return result;
}

} // namespace Refract
