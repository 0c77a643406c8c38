// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

class SqlConnection;

/// Represents a logger for SQL and ORM operations.
///
/// One logger instance is active per process, see SetLogger(). Statements, transactions and the
/// entity layer all report through it. Every event is ignored unless overridden.
class REFRACT_API SqlLogger
{
  public:
    enum class TransactionEvent : uint8_t
    {
        Begin,
        Commit,
        Rollback,
    };

    SqlLogger() = default;
    SqlLogger(SqlLogger const& /*other*/) = default;
    SqlLogger(SqlLogger&& /*other*/) = default;
    SqlLogger& operator=(SqlLogger const& /*other*/) = default;
    SqlLogger& operator=(SqlLogger&& /*other*/) = default;
    virtual ~SqlLogger() = default;

    virtual void OnWarning(std::string_view /*message*/) {}

    /// Invoked when an ODBC call failed.
    virtual void OnError(SqlErrorInfo const& /*errorInfo*/,
                         std::source_location /*sourceLocation*/ = std::source_location::current())
    {
    }

    virtual void OnConnectionOpened(SqlConnection const& /*connection*/) {}
    virtual void OnConnectionClosed(SqlConnection const& /*connection*/) {}

    virtual void OnExecuteDirect(std::string_view /*query*/) {}
    virtual void OnPrepare(std::string_view /*query*/) {}

    /// Invoked once per bound parameter of the next OnExecute(), in parameter order.
    virtual void OnBind(std::string /*value*/) {}

    virtual void OnExecute(std::string_view /*query*/) {}
    virtual void OnFetchRow() {}
    virtual void OnFetchEnd() {}

    virtual void OnTransaction(SqlConnection const& /*connection*/, TransactionEvent /*event*/) {}

    /// Invoked when a write or a deferred lookup found no matching row.
    virtual void OnRecordNotFound(std::string_view /*entityName*/, std::string_view /*condition*/) {}

    /// Invoked when a deferred lookup resolved a foreign key value.
    virtual void OnDeferredLookupResolved(std::string_view /*entityName*/, std::string_view /*key*/) {}

    /// Invoked by the code generator once per printed entity.
    virtual void OnEntityGenerated(std::string_view /*entityName*/) {}

    /// Retrieves a logger that does nothing.
    static SqlLogger& NullLogger() noexcept;

    /// Retrieves a logger that logs errors and warnings to standard output.
    static SqlLogger& StandardLogger();

    /// Retrieves a logger that additionally logs every statement and transaction.
    static SqlLogger& TraceLogger();

    /// Retrieves the currently configured logger.
    static SqlLogger& GetLogger();

    /// Sets the current logger.
    ///
    /// The ownership of the logger is not transferred and remains with the caller.
    static void SetLogger(SqlLogger& logger);
};

template <>
struct std::formatter<SqlLogger::TransactionEvent>: formatter<std::string_view>
{
    auto format(SqlLogger::TransactionEvent event, format_context& ctx) const -> format_context::iterator
    {
        using enum SqlLogger::TransactionEvent;
        switch (event)
        {
            case Begin:
                return formatter<std::string_view>::format("BEGIN TRANSACTION", ctx);
            case Commit:
                return formatter<std::string_view>::format("COMMIT", ctx);
            case Rollback:
                return formatter<std::string_view>::format("ROLLBACK", ctx);
        }
        return formatter<std::string_view>::format("?", ctx);
    }
};
