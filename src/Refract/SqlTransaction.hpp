// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>

class SqlConnection;

/// How a transaction ends when its scope is left without Commit() or Rollback().
enum class SqlTransactionMode : std::uint8_t
{
    NONE,
    COMMIT,
    ROLLBACK,
};

class SqlTransactionException: public std::runtime_error
{
  public:
    explicit SqlTransactionException(std::string const& message):
        std::runtime_error(message)
    {
    }
};

/// Scoped transaction on a connection.
///
/// Switches auto-commit off while active. If the connection already runs a transaction, the new
/// object joins it: Commit() and Rollback() do nothing, and the outermost transaction decides the
/// outcome.
class REFRACT_API SqlTransaction
{
  public:
    SqlTransaction() = delete;
    SqlTransaction(SqlTransaction const&) = delete;
    SqlTransaction& operator=(SqlTransaction const&) = delete;
    SqlTransaction(SqlTransaction&& other) noexcept;
    SqlTransaction& operator=(SqlTransaction&&) = delete;

    explicit SqlTransaction(SqlConnection& connection,
                            SqlTransactionMode defaultMode = SqlTransactionMode::COMMIT,
                            std::source_location location = std::source_location::current());

    ~SqlTransaction() noexcept;

    /// Tests whether this object joined an already running transaction.
    [[nodiscard]] bool IsJoined() const noexcept
    {
        return m_joined;
    }

    /// Throws SqlTransactionException if the rollback failed.
    void Rollback();

    bool TryRollback() noexcept;

    /// Throws SqlTransactionException if the commit failed.
    void Commit();

    bool TryCommit() noexcept;

  private:
    bool Finish(SqlTransactionMode mode) noexcept;

    SqlConnection* m_connection;
    SqlTransactionMode m_pendingMode;
    bool m_joined = false;
    std::source_location m_location;
};
