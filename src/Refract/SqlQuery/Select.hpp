// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Query builder for building SELECT ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlSelectQueryBuilder final
{
  public:
    SqlSelectQueryBuilder(SqlQueryFormatter const& formatter, std::string table) noexcept:
        m_formatter { formatter },
        m_table { std::move(table) }
    {
    }

    /// Adds a DISTINCT clause to the SELECT query.
    REFRACT_API SqlSelectQueryBuilder& Distinct() noexcept;

    /// Adds a single column qualified by its table to the SELECT clause.
    REFRACT_API SqlSelectQueryBuilder& Field(SqlQualifiedTableColumnName const& fieldName);

    /// Adds a sequence of columns of the given table to the SELECT clause.
    REFRACT_API SqlSelectQueryBuilder& Fields(std::vector<std::string_view> const& fieldNames,
                                              std::string_view tableName);

    /// Adds an SQL expression (e.g. an aggregate function) with an alias to the SELECT clause.
    REFRACT_API SqlSelectQueryBuilder& FieldExpressionAs(std::string_view expression, std::string_view alias);

    /// Adds a rendered condition along with the values of its placeholders. Conditions are AND-ed.
    REFRACT_API SqlSelectQueryBuilder& Where(std::string_view condition, std::vector<SqlVariant> values = {});

    /// Constructs or extends a GROUP BY clause.
    REFRACT_API SqlSelectQueryBuilder& GroupBy(std::string_view columnName);

    /// Adds a HAVING condition to the GROUP BY clause. Conditions are AND-ed.
    REFRACT_API SqlSelectQueryBuilder& Having(std::string_view condition);

    /// Constructs or extends an ORDER BY clause.
    REFRACT_API SqlSelectQueryBuilder& OrderBy(SqlQualifiedTableColumnName const& columnName,
                                               SqlResultOrdering ordering = SqlResultOrdering::ASCENDING,
                                               SqlNullsOrdering nulls = SqlNullsOrdering::DEFAULT);

    /// Orders by a raw SQL expression, e.g. an aggregate.
    REFRACT_API SqlSelectQueryBuilder& OrderByExpression(std::string_view expression,
                                                         SqlResultOrdering ordering = SqlResultOrdering::ASCENDING);

    /// Finalizes building the query as SELECT COUNT(*) FROM ... query.
    [[nodiscard]] REFRACT_API SqlBoundQuery Count() const;

    /// Finalizes building the query as SELECT fields FROM ... query.
    [[nodiscard]] REFRACT_API SqlBoundQuery All() const;

    /// Finalizes building the query as SELECT fields FROM ... query, restricted to a window of rows.
    ///
    /// A missing limit selects all rows past the offset.
    [[nodiscard]] REFRACT_API SqlBoundQuery Range(std::size_t offset, std::optional<std::size_t> limit) const;

  private:
    [[nodiscard]] std::string SelectFrom() const;

    SqlQueryFormatter const& m_formatter;
    std::string m_table;
    bool m_distinct = false;
    std::string m_fields;
    detail::SqlWhereClause m_where;
    std::string m_groupBy;
    std::string m_having;
    std::string m_orderBy;
};
