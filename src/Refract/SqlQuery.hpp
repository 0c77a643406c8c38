// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "SqlQuery/Select.hpp"
#include "SqlQuery/Write.hpp"

/// API Entry point for building SQL queries against a single table.
///
/// Each builder composes an SqlBoundQuery, to be run by SqlStatement::Execute().
class [[nodiscard]] SqlQueryBuilder final
{
  public:
    SqlQueryBuilder(SqlQueryFormatter const& formatter, std::string table) noexcept:
        m_formatter { formatter },
        m_table { std::move(table) }
    {
    }

    [[nodiscard]] SqlSelectQueryBuilder Select() const
    {
        return SqlSelectQueryBuilder { m_formatter, m_table };
    }

    [[nodiscard]] SqlInsertQueryBuilder Insert() const
    {
        return SqlInsertQueryBuilder { m_table };
    }

    [[nodiscard]] SqlUpdateQueryBuilder Update() const
    {
        return SqlUpdateQueryBuilder { m_table };
    }

    [[nodiscard]] SqlDeleteQueryBuilder Delete() const
    {
        return SqlDeleteQueryBuilder { m_table };
    }

  private:
    SqlQueryFormatter const& m_formatter;
    std::string m_table;
};
