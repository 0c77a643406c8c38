// SPDX-License-Identifier: Apache-2.0

#include "Select.hpp"

namespace
{

void AppendListItem(std::string& list, std::string_view keyword, std::string_view item)
{
    if (list.empty())
        list += keyword;
    else
        list += ", ";
    list += item;
}

} // namespace

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Distinct() noexcept
{
    m_distinct = true;
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Field(SqlQualifiedTableColumnName const& fieldName)
{
    AppendListItem(m_fields, "", detail::MakeSqlColumnName(fieldName));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Fields(std::vector<std::string_view> const& fieldNames,
                                                     std::string_view tableName)
{
    for (auto const& fieldName: fieldNames)
        Field(SqlQualifiedTableColumnName { .tableName = tableName, .columnName = fieldName });
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::FieldExpressionAs(std::string_view expression, std::string_view alias)
{
    AppendListItem(m_fields, "", std::format(R"({} AS "{}")", expression, alias));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Where(std::string_view condition, std::vector<SqlVariant> values)
{
    m_where.Add(condition, std::move(values));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::GroupBy(std::string_view columnName)
{
    AppendListItem(m_groupBy, "\n GROUP BY ", detail::MakeSqlColumnName(columnName));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Having(std::string_view condition)
{
    m_having += m_having.empty() ? "\n HAVING " : " AND ";
    m_having += condition;
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::OrderBy(SqlQualifiedTableColumnName const& columnName,
                                                      SqlResultOrdering ordering,
                                                      SqlNullsOrdering nulls)
{
    AppendListItem(
        m_orderBy, "\n ORDER BY ", m_formatter.OrderByItem(detail::MakeSqlColumnName(columnName), ordering, nulls));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::OrderByExpression(std::string_view expression,
                                                                SqlResultOrdering ordering)
{
    AppendListItem(
        m_orderBy, "\n ORDER BY ", m_formatter.OrderByItem(expression, ordering, SqlNullsOrdering::DEFAULT));
    return *this;
}

std::string SqlSelectQueryBuilder::SelectFrom() const
{
    return std::format(R"(SELECT {}{} FROM "{}"{}{}{}{})",
                       m_distinct ? "DISTINCT " : "",
                       m_fields.empty() ? "*" : m_fields,
                       m_table,
                       m_where.Sql(),
                       m_groupBy,
                       m_having,
                       m_orderBy);
}

SqlBoundQuery SqlSelectQueryBuilder::Count() const
{
    return SqlBoundQuery {
        .sql = std::format(R"(SELECT COUNT(*) FROM "{}"{})", m_table, m_where.Sql()),
        .bindings = m_where.Bindings(),
    };
}

SqlBoundQuery SqlSelectQueryBuilder::All() const
{
    return SqlBoundQuery { .sql = SelectFrom(), .bindings = m_where.Bindings() };
}

SqlBoundQuery SqlSelectQueryBuilder::Range(std::size_t offset, std::optional<std::size_t> limit) const
{
    return SqlBoundQuery {
        .sql = SelectFrom() + m_formatter.RowWindow(!m_orderBy.empty(), offset, limit),
        .bindings = m_where.Bindings(),
    };
}
