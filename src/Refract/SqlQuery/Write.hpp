// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <string>
#include <string_view>
#include <vector>

/// Query builder for building INSERT INTO ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlInsertQueryBuilder final
{
  public:
    explicit SqlInsertQueryBuilder(std::string table) noexcept:
        m_table { std::move(table) }
    {
    }

    /// Adds a column to insert. A NULL value is rendered as a literal instead of being bound.
    REFRACT_API SqlInsertQueryBuilder& Set(std::string_view columnName, SqlVariant value);

    /// Finalizes the query. Inserting no columns inserts a row of default values.
    [[nodiscard]] REFRACT_API SqlBoundQuery Compose() const;

  private:
    std::string m_table;
    std::string m_columns;
    std::string m_values;
    std::vector<SqlVariant> m_bindings;
};

/// Query builder for building UPDATE ... SET ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlUpdateQueryBuilder final
{
  public:
    explicit SqlUpdateQueryBuilder(std::string table) noexcept:
        m_table { std::move(table) }
    {
    }

    /// Assigns a value to a column. A NULL value is rendered as a literal instead of being bound.
    REFRACT_API SqlUpdateQueryBuilder& Set(std::string_view columnName, SqlVariant value);

    /// Assigns a rendered SQL expression to a column, along with the values of its placeholders.
    REFRACT_API SqlUpdateQueryBuilder& SetExpression(std::string_view columnName,
                                                     std::string_view expression,
                                                     std::vector<SqlVariant> values);

    REFRACT_API SqlUpdateQueryBuilder& Where(std::string_view condition, std::vector<SqlVariant> values = {});

    /// Finalizes the query, binding the SET values ahead of the WHERE values.
    [[nodiscard]] REFRACT_API SqlBoundQuery Compose() const;

  private:
    std::string m_table;
    std::string m_assignments;
    std::vector<SqlVariant> m_bindings;
    detail::SqlWhereClause m_where;
};

/// Query builder for building DELETE FROM ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlDeleteQueryBuilder final
{
  public:
    explicit SqlDeleteQueryBuilder(std::string table) noexcept:
        m_table { std::move(table) }
    {
    }

    REFRACT_API SqlDeleteQueryBuilder& Where(std::string_view condition, std::vector<SqlVariant> values = {});

    [[nodiscard]] REFRACT_API SqlBoundQuery Compose() const;

  private:
    std::string m_table;
    detail::SqlWhereClause m_where;
};
