// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "DataBinder/SqlVariant.hpp"
#include "DataBinder/SqlVariantBinder.hpp"
#include "SqlConnection.hpp"
#include "SqlQuery/Core.hpp"
#include "Utils.hpp"

#include <format>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// High level API for (prepared) raw SQL statements
///
/// SQL prepared statement lifecycle:
/// 1. Prepare the statement
/// 2. Execute the statement with its input parameters
/// 3. Fetch rows (if any) and read their columns
/// 4. Repeat steps 2 and 3 as needed
class SqlStatement final
{
  public:
    /// Construct a new SqlStatement object, using the given connection.
    REFRACT_API explicit SqlStatement(SqlConnection& relatedConnection);

    REFRACT_API SqlStatement(SqlStatement&&) noexcept;
    REFRACT_API SqlStatement& operator=(SqlStatement&&) noexcept;

    SqlStatement(SqlStatement const&) = delete;
    SqlStatement& operator=(SqlStatement const&) = delete;

    REFRACT_API ~SqlStatement() noexcept;

    [[nodiscard]] bool IsAlive() const noexcept
    {
        return m_connection && m_connection->IsAlive() && m_stmt != nullptr;
    }

    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    /// Retrieves the last error information with respect to this SQL statement handle.
    [[nodiscard]] SqlErrorInfo LastError() const
    {
        return SqlErrorInfo::fromStatementHandle(m_stmt);
    }

    [[nodiscard]] SQLHSTMT NativeHandle() const noexcept
    {
        return m_stmt;
    }

    /// Prepares the statement for execution.
    ///
    /// @note A pending result set of the previously executed statement is closed.
    REFRACT_API void Prepare(std::string_view query);

    /// Binds the given values to the prepared statement's placeholders, in order, and executes it.
    REFRACT_API void ExecuteWithVariants(std::vector<SqlVariant> const& args);

    /// Prepares and executes a composed query with its bound values.
    REFRACT_API void Execute(SqlBoundQuery const& query);

    /// Executes the given query directly.
    REFRACT_API void ExecuteDirect(std::string_view query,
                                   std::source_location location = std::source_location::current());

    /// Executes the given query and returns the first column of the first row, if any and not NULL.
    template <typename T>
    [[nodiscard]] std::optional<T> ExecuteDirectScalar(std::string_view query,
                                                       std::source_location location = std::source_location::current());

    [[nodiscard]] REFRACT_API size_t NumRowsAffected() const;

    [[nodiscard]] REFRACT_API size_t NumColumnsAffected() const;

    /// Retrieves the name (label) of the given result column.
    [[nodiscard]] REFRACT_API std::string ColumnName(SQLUSMALLINT column) const;

    /// Retrieves the last insert ID of the given table.
    [[nodiscard]] REFRACT_API size_t LastInsertId(std::string_view tableName);

    /// Fetches the next row of the result set.
    ///
    /// @note Automatically closes the cursor at the end of the result set.
    ///
    /// @retval true The next result row was successfully fetched
    /// @retval false No result row was fetched, because the end of the result set was reached.
    [[nodiscard]] REFRACT_API bool FetchRow();

    /// Closes the result cursor on queries that yield a result set, e.g. SELECT statements.
    REFRACT_API void CloseCursor() noexcept;

    /// Retrieves the value of the column at the given index for the currently selected row.
    ///
    /// Reading into SqlVariant yields NULL as is. Any other type throws on NULL or on a value
    /// that does not convert into it.
    template <typename T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const;

  private:
    REFRACT_API void RequireSuccess(SQLRETURN result,
                                    std::source_location sourceLocation = std::source_location::current()) const;

    SqlConnection* m_connection {};
    SQLHSTMT m_stmt {};
    std::string m_query;             // last prepared query
    SQLSMALLINT m_parameterCount {}; // placeholders of m_query
};

template <typename T>
T SqlStatement::GetColumn(SQLUSMALLINT column) const
{
    auto value = SqlVariant {};
    RequireSuccess(ReadColumn(m_stmt, column, value));

    if constexpr (std::same_as<T, SqlVariant>)
        return value;
    else
    {
        if (value.IsNull())
            throw std::runtime_error { std::format("Column {} value is NULL", column) };
        auto result = value.TryGetAs<T>();
        if (!result)
            throw std::runtime_error { std::format("Column {} value {} has an unexpected type", column, value) };
        return std::move(*result);
    }
}

template <typename T>
std::optional<T> SqlStatement::ExecuteDirectScalar(std::string_view query, std::source_location location)
{
    auto const _ = detail::Finally([this] { CloseCursor(); });
    ExecuteDirect(query, location);
    if (!FetchRow())
        return std::nullopt;

    auto const value = GetColumn<SqlVariant>(1);
    if (value.IsNull())
        return std::nullopt;
    return value.TryGetAs<T>();
}
