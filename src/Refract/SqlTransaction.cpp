// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlTransaction.hpp"

#include <utility>

namespace
{

bool SetAutoCommit(SQLHDBC hDbc, bool enabled) noexcept
{
    auto const value = enabled ? SQL_AUTOCOMMIT_ON : SQL_AUTOCOMMIT_OFF;
    // NOLINTNEXTLINE(performance-no-int-to-ptr)
    return SQL_SUCCEEDED(SQLSetConnectAttrA(hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) (SQLULEN) value, SQL_IS_UINTEGER));
}

} // namespace

SqlTransaction::SqlTransaction(SqlConnection& connection, SqlTransactionMode defaultMode, std::source_location location):
    m_connection { &connection },
    m_pendingMode { defaultMode },
    m_joined { connection.TransactionActive() },
    m_location { location }
{
    if (m_joined)
    {
        m_pendingMode = SqlTransactionMode::NONE;
        return;
    }

    if (!SetAutoCommit(connection.NativeHandle(), false))
        throw SqlException(connection.LastError(), m_location);
    SqlLogger::GetLogger().OnTransaction(connection, SqlLogger::TransactionEvent::Begin);
}

SqlTransaction::SqlTransaction(SqlTransaction&& other) noexcept:
    m_connection { other.m_connection },
    m_pendingMode { std::exchange(other.m_pendingMode, SqlTransactionMode::NONE) },
    m_joined { std::exchange(other.m_joined, true) },
    m_location { other.m_location }
{
}

SqlTransaction::~SqlTransaction() noexcept
{
    Finish(m_pendingMode);
}

bool SqlTransaction::Finish(SqlTransactionMode mode) noexcept
{
    if (m_joined || mode == SqlTransactionMode::NONE)
        return true;

    auto const hDbc = m_connection->NativeHandle();
    auto const completion = mode == SqlTransactionMode::COMMIT ? SQL_COMMIT : SQL_ROLLBACK;
    if (!SQL_SUCCEEDED(SQLEndTran(SQL_HANDLE_DBC, hDbc, completion)) || !SetAutoCommit(hDbc, true))
    {
        SqlLogger::GetLogger().OnError(m_connection->LastError(), m_location);
        return false;
    }

    m_pendingMode = SqlTransactionMode::NONE;
    SqlLogger::GetLogger().OnTransaction(*m_connection,
                                         mode == SqlTransactionMode::COMMIT ? SqlLogger::TransactionEvent::Commit
                                                                            : SqlLogger::TransactionEvent::Rollback);
    return true;
}

bool SqlTransaction::TryRollback() noexcept
{
    return Finish(SqlTransactionMode::ROLLBACK);
}

bool SqlTransaction::TryCommit() noexcept
{
    return Finish(SqlTransactionMode::COMMIT);
}

void SqlTransaction::Rollback()
{
    if (!TryRollback())
        throw SqlTransactionException("Failed to roll back the transaction");
}

void SqlTransaction::Commit()
{
    if (!TryCommit())
        throw SqlTransactionException("Failed to commit the transaction");
}
