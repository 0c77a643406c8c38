// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../SqlQuery/Core.hpp"
#include "../SqlQueryFormatter.hpp"
#include "ConditionTree.hpp"
#include "OperatorTable.hpp"

#include <format>
#include <ranges>

namespace Refract
{

namespace
{

    std::string ColumnReference(std::string_view table, std::string_view column)
    {
        if (table.empty())
            return ::detail::MakeSqlColumnName(column);
        return ::detail::MakeSqlColumnName(SqlQualifiedTableColumnName { .tableName = table, .columnName = column });
    }

    std::string_view ComparisonOperator(FieldOperator op) noexcept
    {
        switch (op)
        {
            case FieldOperator::GreaterThan:
                return ">";
            case FieldOperator::LessThan:
                return "<";
            case FieldOperator::GreaterOrEqual:
                return ">=";
            case FieldOperator::LessOrEqual:
                return "<=";
            default:
                break;
        }
        return "=";
    }

    SqlStringMatch StringMatchKind(FieldOperator op) noexcept
    {
        switch (op)
        {
            case FieldOperator::StartsWith:
            case FieldOperator::JsonStringStartsWith:
                return SqlStringMatch::STARTS_WITH;
            case FieldOperator::EndsWith:
            case FieldOperator::JsonStringEndsWith:
                return SqlStringMatch::ENDS_WITH;
            default:
                break;
        }
        return SqlStringMatch::CONTAINS;
    }

    class Renderer
    {
      public:
        Renderer(SqlQueryFormatter const& formatter, std::vector<SqlVariant>& bindings):
            m_formatter { formatter },
            m_bindings { bindings }
        {
        }

        std::string Render(ConditionNode const& condition)
        {
            return std::visit([this](auto const& node) { return RenderNode(node); }, condition.node);
        }

      private:
        std::string RenderNode(ConstantCondition const& node)
        {
            return node.value ? "1 = 1" : "1 = 0";
        }

        std::string RenderNode(JunctionCondition const& node)
        {
            if (node.children.empty())
                return node.kind == JunctionKind::All ? "1 = 1" : "1 = 0";

            if (node.children.size() == 1)
                return Render(node.children.front());

            auto const* separator = node.kind == JunctionKind::All ? " AND " : " OR ";
            std::string result = "(";
            for (auto const& [index, child]: node.children | std::views::enumerate)
            {
                if (index != 0)
                    result += separator;
                result += Render(child);
            }
            result += ')';
            return result;
        }

        std::string RenderNode(NotCondition const& node)
        {
            if (!node.child)
                throw PredicateContractError("NOT condition without operand");
            return std::format("NOT ({})", Render(*node.child));
        }

        std::string RenderNode(ExistsCondition const& node)
        {
            auto condition = std::format("{} = {}",
                                         ColumnReference(node.alias, node.innerColumn),
                                         ColumnReference(node.outerTable, node.outerColumn));

            if (node.filter && !IsTriviallyTrue(*node.filter))
                condition += std::format(" AND {}", Render(*node.filter));

            return std::format(R"({}EXISTS (SELECT 1 FROM "{}" AS "{}" WHERE {}))",
                               node.negated ? "NOT " : "",
                               node.table,
                               node.alias,
                               condition);
        }

        std::string RenderNode(ColumnCondition const& node)
        {
            auto const column = ColumnReference(node.table, node.column);

            auto const requireValues = [&](size_t count) {
                if (node.values.size() != count)
                    throw PredicateContractError(std::format("Operator {} on column {} expects {} value(s), got {}",
                                                             NameOf(node.op),
                                                             node.column,
                                                             count,
                                                             node.values.size()));
            };

            auto const bindPath = [&] {
                m_bindings.emplace_back(m_formatter.JsonPathArgument(node.jsonPath));
            };

            auto const bindPattern = [&] {
                auto const& value = node.values.front();
                auto const text = value.TryGetStringView().transform([](auto v) { return std::string(v); });
                m_bindings.emplace_back(m_formatter.StringMatchPattern(
                    StringMatchKind(node.op), text.value_or(value.ToString()), node.caseInsensitive));
            };

            switch (node.op)
            {
                case FieldOperator::Equals:
                    requireValues(1);
                    if (node.values.front().IsNull())
                        return std::format("{} IS NULL", column);
                    m_bindings.push_back(node.values.front());
                    if (node.caseInsensitive)
                        return m_formatter.CaseInsensitiveEquals(column);
                    return std::format("{} = ?", column);
                case FieldOperator::NotEquals:
                    requireValues(1);
                    if (node.values.front().IsNull())
                        return std::format("{} IS NOT NULL", column);
                    m_bindings.push_back(node.values.front());
                    if (node.caseInsensitive)
                        return std::format("NOT ({})", m_formatter.CaseInsensitiveEquals(column));
                    return std::format("{} <> ?", column);
                case FieldOperator::GreaterThan:
                case FieldOperator::LessThan:
                case FieldOperator::GreaterOrEqual:
                case FieldOperator::LessOrEqual:
                    requireValues(1);
                    m_bindings.push_back(node.values.front());
                    return std::format("{} {} ?", column, ComparisonOperator(node.op));
                case FieldOperator::Contains:
                case FieldOperator::StartsWith:
                case FieldOperator::EndsWith:
                    requireValues(1);
                    bindPattern();
                    return m_formatter.StringMatch(column, node.caseInsensitive);
                case FieldOperator::InSet:
                case FieldOperator::NotInSet: {
                    bool const negated = node.op == FieldOperator::NotInSet;
                    if (node.values.empty())
                        return negated ? "1 = 1" : "1 = 0";
                    std::string placeholders;
                    for (auto const& value: node.values)
                    {
                        if (!placeholders.empty())
                            placeholders += ", ";
                        placeholders += '?';
                        m_bindings.push_back(value);
                    }
                    return std::format("{} {}IN ({})", column, negated ? "NOT " : "", placeholders);
                }
                case FieldOperator::IsNull:
                    return std::format("{} IS NULL", column);
                case FieldOperator::IsNotNull:
                    return std::format("{} IS NOT NULL", column);
                case FieldOperator::JsonPathEquals:
                    requireValues(1);
                    bindPath();
                    m_bindings.push_back(node.values.front());
                    return std::format("{} = ?", m_formatter.JsonExtractText(column));
                case FieldOperator::JsonStringContains:
                case FieldOperator::JsonStringStartsWith:
                case FieldOperator::JsonStringEndsWith:
                    requireValues(1);
                    bindPath();
                    bindPattern();
                    return m_formatter.StringMatch(m_formatter.JsonExtractText(column), node.caseInsensitive);
                case FieldOperator::JsonArrayContains:
                    requireValues(1);
                    bindPath();
                    m_bindings.push_back(node.values.front());
                    return m_formatter.JsonArrayElementsExist(column, "value = ?");
                case FieldOperator::JsonArrayStartsWith:
                case FieldOperator::JsonArrayEndsWith:
                    requireValues(1);
                    bindPath();
                    m_bindings.push_back(node.values.front());
                    return std::format("{} = ?",
                                       m_formatter.JsonArrayElementText(
                                           column, node.op == FieldOperator::JsonArrayEndsWith));
                case FieldOperator::JsonHasKey:
                    if (node.jsonPath.empty())
                        throw PredicateContractError(std::format("JsonHasKey on column {} without a path", node.column));
                    bindPath();
                    return m_formatter.JsonHasPath(column);
                case FieldOperator::JsonNull:
                    switch (node.nullKind)
                    {
                        case JsonNullKind::DbNull:
                            return std::format("{} IS NULL", column);
                        case JsonNullKind::JsonNull:
                            return m_formatter.JsonIsNullLiteral(column);
                        case JsonNullKind::AnyNull:
                            return std::format("({} IS NULL OR {})", column, m_formatter.JsonIsNullLiteral(column));
                    }
                    break;
            }
            throw PredicateContractError(
                std::format("Unknown operator {} on column {}", static_cast<int>(node.op), node.column));
        }

        SqlQueryFormatter const& m_formatter;
        std::vector<SqlVariant>& m_bindings;
    };

} // namespace

std::string RenderCondition(ConditionNode const& condition,
                            SqlQueryFormatter const& formatter,
                            std::vector<SqlVariant>& bindings)
{
    return Renderer { formatter, bindings }.Render(condition);
}

} // namespace Refract
