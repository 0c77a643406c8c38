// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "../SqlQueryFormatter.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

/// Name of a column qualified by its table name.
struct SqlQualifiedTableColumnName
{
    std::string_view tableName;
    std::string_view columnName;
};

/// A composed statement along with the values of its '?' placeholders, in placeholder order.
struct [[nodiscard]] SqlBoundQuery
{
    std::string sql;
    std::vector<SqlVariant> bindings;
};

namespace detail
{

inline std::string MakeSqlColumnName(std::string_view columnName)
{
    return std::format(R"("{}")", columnName);
}

inline std::string MakeSqlColumnName(SqlQualifiedTableColumnName const& columnName)
{
    return std::format(R"("{}"."{}")", columnName.tableName, columnName.columnName);
}

/// The WHERE clause of a statement.
///
/// Conditions are rendered SQL fragments with '?' placeholders. They are AND-ed, each one
/// parenthesized, and their values are kept in the order the fragments were added.
class SqlWhereClause
{
  public:
    void Add(std::string_view condition, std::vector<SqlVariant> values)
    {
        m_sql += m_sql.empty() ? "\n WHERE (" : " AND (";
        m_sql += condition;
        m_sql += ')';
        std::ranges::move(values, std::back_inserter(m_bindings));
    }

    [[nodiscard]] std::string const& Sql() const noexcept
    {
        return m_sql;
    }

    [[nodiscard]] std::vector<SqlVariant> const& Bindings() const noexcept
    {
        return m_bindings;
    }

  private:
    std::string m_sql;
    std::vector<SqlVariant> m_bindings;
};

} // namespace detail
