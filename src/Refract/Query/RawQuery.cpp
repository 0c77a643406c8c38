// SPDX-License-Identifier: Apache-2.0

#include "../SqlStatement.hpp"
#include "RawQuery.hpp"

namespace Refract
{

std::vector<SqlRecord> ExecuteRaw(SqlConnection& connection,
                                  std::string_view sql,
                                  std::vector<SqlVariant> const& parameters)
{
    auto stmt = SqlStatement { connection };
    stmt.Prepare(sql);
    stmt.ExecuteWithVariants(parameters);

    auto rows = std::vector<SqlRecord> {};
    if (stmt.NumColumnsAffected() == 0)
        return rows;

    while (stmt.FetchRow())
        rows.emplace_back(SqlRecord::FromCurrentRow(stmt));
    return rows;
}

size_t ExecuteRawStatement(SqlConnection& connection,
                           std::string_view sql,
                           std::vector<SqlVariant> const& parameters)
{
    auto stmt = SqlStatement { connection };
    stmt.Prepare(sql);
    stmt.ExecuteWithVariants(parameters);
    return stmt.NumRowsAffected();
}

} // namespace Refract
