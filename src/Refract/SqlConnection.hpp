// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlError.hpp"
#include "SqlTraits.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>

class SqlQueryBuilder;
class SqlQueryFormatter;

/// An open ODBC connection, together with the SQL dialect of the server it talks to.
///
/// A connection is not thread-safe. Use one connection per thread; independent queries run
/// concurrently on independent connections.
class REFRACT_API SqlConnection final
{
  public:
    using PostConnectedHook = std::function<void(SqlConnection&)>;

    /// Connects to the default connection string.
    SqlConnection();

    /// Connects to the given connection string. Without one, the connection stays closed.
    explicit SqlConnection(std::optional<SqlConnectionString> connectionString);

    SqlConnection(SqlConnection&& other) noexcept;
    SqlConnection& operator=(SqlConnection&& other) noexcept;
    SqlConnection(SqlConnection const&) = delete;
    SqlConnection& operator=(SqlConnection const&) = delete;
    ~SqlConnection() noexcept;

    /// The connection string of default-constructed connections.
    ///
    /// Unless set explicitly, it is read from the REFRACT_CONNECTION_STRING environment variable.
    static SqlConnectionString const& DefaultConnectionString() noexcept;
    static void SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept;

    /// Runs after every successful connect, e.g. to enable SQLite foreign keys.
    static void SetPostConnectedHook(PostConnectedHook hook);

    /// Process-unique number of this connection, for log output.
    [[nodiscard]] uint64_t ConnectionId() const noexcept
    {
        return m_id;
    }

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

    [[nodiscard]] bool IsAlive() const noexcept;

    [[nodiscard]] SqlErrorInfo LastError() const;

    /// The DBMS product name reported by the driver, e.g. "SQLite".
    [[nodiscard]] std::string ServerName() const;
    [[nodiscard]] std::string ServerVersion() const;

    [[nodiscard]] SqlServerType ServerType() const noexcept
    {
        return m_serverType;
    }

    [[nodiscard]] SqlQueryFormatter const& QueryFormatter() const noexcept
    {
        return *m_formatter;
    }

    /// Starts building a statement against the given table, in this connection's dialect.
    [[nodiscard]] SqlQueryBuilder Query(std::string_view table) const;

    /// True while auto-commit is switched off.
    [[nodiscard]] bool TransactionActive() const noexcept;
    [[nodiscard]] bool TransactionsAllowed() const noexcept;

    [[nodiscard]] SQLHDBC NativeHandle() const noexcept
    {
        return m_dbc;
    }

    /// Throws SqlException with the connection's diagnostic record unless @p result succeeded.
    void RequireSuccess(SQLRETURN result, std::source_location location = std::source_location::current()) const;

  private:
    bool Open(SqlConnectionString connectionString) noexcept;
    void Release() noexcept;
    void AdoptDialect();
    [[nodiscard]] std::string InfoText(SQLUSMALLINT infoType) const;

    SQLHENV m_env {};
    SQLHDBC m_dbc {};
    bool m_open = false;
    uint64_t m_id = 0;
    SqlServerType m_serverType = SqlServerType::UNKNOWN;
    SqlQueryFormatter const* m_formatter {};
    SqlConnectionString m_connectionString;
};
