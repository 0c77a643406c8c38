// SPDX-License-Identifier: Apache-2.0

#include "Write.hpp"

namespace
{

/// Renders NULL as a literal, and any other value as a placeholder whose value is bound.
std::string_view Placeholder(SqlVariant value, std::vector<SqlVariant>& bindings)
{
    if (value.IsNull())
        return "NULL";
    bindings.emplace_back(std::move(value));
    return "?";
}

} // namespace

SqlInsertQueryBuilder& SqlInsertQueryBuilder::Set(std::string_view columnName, SqlVariant value)
{
    if (!m_columns.empty())
    {
        m_columns += ", ";
        m_values += ", ";
    }
    m_columns += detail::MakeSqlColumnName(columnName);
    m_values += Placeholder(std::move(value), m_bindings);
    return *this;
}

SqlBoundQuery SqlInsertQueryBuilder::Compose() const
{
    if (m_columns.empty())
        return SqlBoundQuery { .sql = std::format(R"(INSERT INTO "{}" DEFAULT VALUES)", m_table), .bindings = {} };

    return SqlBoundQuery {
        .sql = std::format(R"(INSERT INTO "{}" ({}) VALUES ({}))", m_table, m_columns, m_values),
        .bindings = m_bindings,
    };
}

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::Set(std::string_view columnName, SqlVariant value)
{
    if (!m_assignments.empty())
        m_assignments += ", ";
    m_assignments += detail::MakeSqlColumnName(columnName);
    m_assignments += " = ";
    m_assignments += Placeholder(std::move(value), m_bindings);
    return *this;
}

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::SetExpression(std::string_view columnName,
                                                            std::string_view expression,
                                                            std::vector<SqlVariant> values)
{
    if (!m_assignments.empty())
        m_assignments += ", ";
    m_assignments += std::format("{} = {}", detail::MakeSqlColumnName(columnName), expression);
    std::ranges::move(values, std::back_inserter(m_bindings));
    return *this;
}

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::Where(std::string_view condition, std::vector<SqlVariant> values)
{
    m_where.Add(condition, std::move(values));
    return *this;
}

SqlBoundQuery SqlUpdateQueryBuilder::Compose() const
{
    auto result = SqlBoundQuery {
        .sql = std::format(R"(UPDATE "{}" SET {}{})", m_table, m_assignments, m_where.Sql()),
        .bindings = m_bindings,
    };
    result.bindings.insert(result.bindings.end(), m_where.Bindings().begin(), m_where.Bindings().end());
    return result;
}

SqlDeleteQueryBuilder& SqlDeleteQueryBuilder::Where(std::string_view condition, std::vector<SqlVariant> values)
{
    m_where.Add(condition, std::move(values));
    return *this;
}

SqlBoundQuery SqlDeleteQueryBuilder::Compose() const
{
    return SqlBoundQuery {
        .sql = std::format(R"(DELETE FROM "{}"{})", m_table, m_where.Sql()),
        .bindings = m_where.Bindings(),
    };
}
