// SPDX-License-Identifier: Apache-2.0

#include "SqlLogger.hpp"
#include "SqlQueryFormatter.hpp"
#include "SqlStatement.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace
{

// SQLSTATE of a column or parameter number out of range.
constexpr std::string_view InvalidDescriptorIndex = "07009";

SQLCHAR* QueryText(std::string_view query) noexcept
{
    // ODBC takes the text by non-const pointer, but does not write to it.
    return reinterpret_cast<SQLCHAR*>(const_cast<char*>(query.data()));
}

} // namespace

SqlStatement::SqlStatement(SqlConnection& relatedConnection):
    m_connection { &relatedConnection }
{
    RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, relatedConnection.NativeHandle(), &m_stmt));
}

SqlStatement::SqlStatement(SqlStatement&& other) noexcept:
    m_connection { std::exchange(other.m_connection, nullptr) },
    m_stmt { std::exchange(other.m_stmt, nullptr) },
    m_query { std::move(other.m_query) },
    m_parameterCount { std::exchange(other.m_parameterCount, 0) }
{
}

SqlStatement& SqlStatement::operator=(SqlStatement&& other) noexcept
{
    auto moved = SqlStatement { std::move(other) };
    std::swap(m_connection, moved.m_connection);
    std::swap(m_stmt, moved.m_stmt);
    std::swap(m_query, moved.m_query);
    std::swap(m_parameterCount, moved.m_parameterCount);
    return *this;
}

SqlStatement::~SqlStatement() noexcept
{
    if (m_stmt)
    {
        SqlLogger::GetLogger().OnFetchEnd();
        SQLFreeHandle(SQL_HANDLE_STMT, m_stmt);
    }
}

void SqlStatement::Prepare(std::string_view query)
{
    SqlLogger::GetLogger().OnPrepare(query);

    // Drops a pending result set along with the parameters bound for the previous query.
    SQLFreeStmt(m_stmt, SQL_CLOSE);
    RequireSuccess(SQLFreeStmt(m_stmt, SQL_RESET_PARAMS));

    m_query = query;
    RequireSuccess(SQLPrepareA(m_stmt, QueryText(m_query), static_cast<SQLINTEGER>(m_query.size())));
    RequireSuccess(SQLNumParams(m_stmt, &m_parameterCount));
}

void SqlStatement::ExecuteWithVariants(std::vector<SqlVariant> const& args)
{
    if (args.size() != static_cast<size_t>(m_parameterCount))
        throw std::invalid_argument { std::format(
            "Query takes {} parameters but {} were given: {}", m_parameterCount, args.size(), m_query) };

    // Bound values point into the context, so it lives until SQLExecute() returned.
    auto context = SqlBindContext { .serverType = m_connection->ServerType() };
    auto& logger = SqlLogger::GetLogger();
    for (auto const& [index, arg]: std::views::enumerate(args))
    {
        logger.OnBind(arg.ToString());
        RequireSuccess(BindParameter(m_stmt, static_cast<SQLUSMALLINT>(index + 1), arg, context));
    }
    logger.OnExecute(m_query);

    // A searched UPDATE or DELETE that matches no row reports SQL_NO_DATA.
    if (auto const result = SQLExecute(m_stmt); result != SQL_NO_DATA)
        RequireSuccess(result);
}

void SqlStatement::Execute(SqlBoundQuery const& query)
{
    Prepare(query.sql);
    ExecuteWithVariants(query.bindings);
}

void SqlStatement::ExecuteDirect(std::string_view query, std::source_location location)
{
    if (query.empty())
        return;

    SqlLogger::GetLogger().OnExecuteDirect(query);
    m_query.clear();
    m_parameterCount = 0;

    SQLFreeStmt(m_stmt, SQL_CLOSE);
    RequireSuccess(SQLExecDirectA(m_stmt, QueryText(query), static_cast<SQLINTEGER>(query.size())), location);
}

size_t SqlStatement::NumRowsAffected() const
{
    SQLLEN rows {};
    RequireSuccess(SQLRowCount(m_stmt, &rows));
    // Drivers report -1 for statements without a row count.
    return static_cast<size_t>(std::max<SQLLEN>(rows, 0));
}

size_t SqlStatement::NumColumnsAffected() const
{
    SQLSMALLINT columns {};
    RequireSuccess(SQLNumResultCols(m_stmt, &columns));
    return static_cast<size_t>(columns);
}

std::string SqlStatement::ColumnName(SQLUSMALLINT column) const
{
    auto label = std::string(256, '\0');
    SQLSMALLINT length {};
    RequireSuccess(SQLColAttributeA(
        m_stmt, column, SQL_DESC_LABEL, label.data(), static_cast<SQLSMALLINT>(label.size()), &length, nullptr));
    label.resize(std::clamp<size_t>(static_cast<size_t>(length), 0, label.size()));
    return label;
}

size_t SqlStatement::LastInsertId(std::string_view tableName)
{
    auto const query = m_connection->QueryFormatter().QueryLastInsertId(tableName);
    return ExecuteDirectScalar<size_t>(query).value_or(0);
}

bool SqlStatement::FetchRow()
{
    auto const result = SQLFetch(m_stmt);
    if (result == SQL_NO_DATA)
    {
        CloseCursor();
        return false;
    }
    RequireSuccess(result);
    SqlLogger::GetLogger().OnFetchRow();
    return true;
}

void SqlStatement::CloseCursor() noexcept
{
    SQLFreeStmt(m_stmt, SQL_CLOSE);
    SqlLogger::GetLogger().OnFetchEnd();
}

void SqlStatement::RequireSuccess(SQLRETURN result, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(result))
        return;

    auto errorInfo = LastError();
    if (errorInfo.sqlState != InvalidDescriptorIndex)
        throw SqlException(std::move(errorInfo), sourceLocation);

    SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);
    throw std::invalid_argument(std::format("Column or parameter out of range: {}", errorInfo));
}
