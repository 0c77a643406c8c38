// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlQuery.hpp"
#include "SqlQueryFormatter.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <format>
#include <mutex>
#include <utility>

namespace
{

struct ConnectionDefaults
{
    SqlConnectionString connectionString;
    std::once_flag environmentRead;
    SqlConnection::PostConnectedHook postConnected;
};

ConnectionDefaults& Defaults()
{
    static ConnectionDefaults defaults;
    return defaults;
}

std::atomic<uint64_t> gLastConnectionId { 0 };

// The first product name fragment found in SQL_DBMS_NAME decides the dialect.
SqlServerType ServerTypeOf(std::string_view productName) noexcept
{
    struct Known
    {
        std::string_view fragment;
        SqlServerType type;
    };
    static constexpr Known known[] = {
        { .fragment = "SQLite", .type = SqlServerType::SQLITE },
        { .fragment = "PostgreSQL", .type = SqlServerType::POSTGRESQL },
        { .fragment = "Microsoft SQL Server", .type = SqlServerType::MICROSOFT_SQL },
        { .fragment = "MySQL", .type = SqlServerType::MYSQL },
        { .fragment = "Oracle", .type = SqlServerType::ORACLE },
    };
    auto const match =
        std::ranges::find_if(known, [&](Known const& entry) { return productName.contains(entry.fragment); });
    return match != std::ranges::end(known) ? match->type : SqlServerType::UNKNOWN;
}

} // namespace

SqlConnection::SqlConnection():
    SqlConnection(DefaultConnectionString())
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectionString):
    m_id { ++gLastConnectionId },
    m_formatter { &SqlQueryFormatter::Sqlite() }
{
    if (SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_env)))
    {
        SQLSetEnvAttr(m_env, SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
        SQLAllocHandle(SQL_HANDLE_DBC, m_env, &m_dbc);
    }

    if (connectionString)
        Open(std::move(*connectionString));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_env { std::exchange(other.m_env, {}) },
    m_dbc { std::exchange(other.m_dbc, {}) },
    m_open { std::exchange(other.m_open, false) },
    m_id { other.m_id },
    m_serverType { other.m_serverType },
    m_formatter { other.m_formatter },
    m_connectionString { std::move(other.m_connectionString) }
{
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this != &other)
    {
        Release();
        m_env = std::exchange(other.m_env, {});
        m_dbc = std::exchange(other.m_dbc, {});
        m_open = std::exchange(other.m_open, false);
        m_id = other.m_id;
        m_serverType = other.m_serverType;
        m_formatter = other.m_formatter;
        m_connectionString = std::move(other.m_connectionString);
    }
    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Release();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    auto& defaults = Defaults();
    std::call_once(defaults.environmentRead, [&] {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        if (auto const* text = std::getenv("REFRACT_CONNECTION_STRING"); text && *text && defaults.connectionString.value.empty())
            defaults.connectionString = SqlConnectionString { .value = text };
    });
    return defaults.connectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    Defaults().connectionString = connectionString;
}

void SqlConnection::SetPostConnectedHook(PostConnectedHook hook)
{
    Defaults().postConnected = std::move(hook);
}

bool SqlConnection::Open(SqlConnectionString connectionString) noexcept
{
    m_connectionString = std::move(connectionString);
    auto& text = m_connectionString.value;

    auto const connected = SQLDriverConnectA(m_dbc,
                                             nullptr,
                                             reinterpret_cast<SQLCHAR*>(text.data()),
                                             static_cast<SQLSMALLINT>(text.size()),
                                             nullptr,
                                             0,
                                             nullptr,
                                             SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(connected))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }
    m_open = true;

    try
    {
        RequireSuccess(SQLSetConnectAttrA(
            m_dbc, SQL_ATTR_AUTOCOMMIT, reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_ON), SQL_IS_UINTEGER));
        AdoptDialect();
        SqlLogger::GetLogger().OnConnectionOpened(*this);
        if (auto const& hook = Defaults().postConnected; hook)
            hook(*this);
        return true;
    }
    catch (SqlException const&)
    {
        // The exception was reported to the logger when it was raised.
        SQLDisconnect(m_dbc);
        m_open = false;
        return false;
    }
}

void SqlConnection::Release() noexcept
{
    if (m_open)
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        SQLDisconnect(m_dbc);
        m_open = false;
    }
    if (m_dbc)
        SQLFreeHandle(SQL_HANDLE_DBC, std::exchange(m_dbc, {}));
    if (m_env)
        SQLFreeHandle(SQL_HANDLE_ENV, std::exchange(m_env, {}));
}

void SqlConnection::AdoptDialect()
{
    auto const productName = ServerName();
    m_serverType = ServerTypeOf(productName);
    m_formatter = SqlQueryFormatter::Get(m_serverType);
    if (!m_formatter)
    {
        SqlLogger::GetLogger().OnWarning(
            std::format("Server {} has no SQL dialect of its own, falling back to the SQLite one", productName));
        m_formatter = &SqlQueryFormatter::Sqlite();
    }
}

std::string SqlConnection::InfoText(SQLUSMALLINT infoType) const
{
    auto text = std::string(256, '\0');
    SQLSMALLINT length {};
    RequireSuccess(SQLGetInfoA(m_dbc, infoType, text.data(), static_cast<SQLSMALLINT>(text.size()), &length));
    text.resize(std::clamp<size_t>(static_cast<size_t>(length), 0, text.size()));
    return text;
}

std::string SqlConnection::ServerName() const
{
    return InfoText(SQL_DBMS_NAME);
}

std::string SqlConnection::ServerVersion() const
{
    return InfoText(SQL_DBMS_VER);
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::fromConnectionHandle(m_dbc);
}

bool SqlConnection::IsAlive() const noexcept
{
    if (!m_open)
        return false;
    SQLUINTEGER dead = SQL_CD_TRUE;
    return SQL_SUCCEEDED(SQLGetConnectAttrA(m_dbc, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr)) && dead == SQL_CD_FALSE;
}

bool SqlConnection::TransactionActive() const noexcept
{
    SQLUINTEGER autoCommit = SQL_AUTOCOMMIT_ON;
    return SQL_SUCCEEDED(SQLGetConnectAttrA(m_dbc, SQL_ATTR_AUTOCOMMIT, &autoCommit, 0, nullptr))
           && autoCommit == SQL_AUTOCOMMIT_OFF;
}

bool SqlConnection::TransactionsAllowed() const noexcept
{
    SQLUSMALLINT capable = SQL_TC_NONE;
    return SQL_SUCCEEDED(SQLGetInfoA(m_dbc, SQL_TXN_CAPABLE, &capable, sizeof(capable), nullptr))
           && capable != SQL_TC_NONE;
}

void SqlConnection::RequireSuccess(SQLRETURN result, std::source_location location) const
{
    if (!SQL_SUCCEEDED(result))
        throw SqlException(LastError(), location);
}

SqlQueryBuilder SqlConnection::Query(std::string_view table) const
{
    return SqlQueryBuilder { QueryFormatter(), std::string(table) };
}
