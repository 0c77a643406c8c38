// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <utility>
#include <vector>

namespace
{

class SqlStandardLogger: public SqlLogger
{
  public:
    void OnWarning(std::string_view message) override
    {
        WriteMessage("Warning: {}", message);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WriteMessage("SQL Error: {}", errorInfo);
        WriteMessage("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
    }

    void OnRecordNotFound(std::string_view entityName, std::string_view condition) override
    {
        WriteMessage("Warning: no {} record matches {}", entityName, condition);
    }

  protected:
    template <typename... Args>
    static void WriteMessage(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println("[{:%F %T}] {}", now, std::format(fmt, std::forward<Args>(args)...));
    }
};

// Writes each statement once it is done, together with its bound values, row count and duration.
class SqlTraceLogger final: public SqlStandardLogger
{
    struct PendingStatement
    {
        std::string query;
        std::vector<std::string> binds;
        std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
        size_t rowCount = 0;
    };

    std::optional<PendingStatement> m_pending;
    std::vector<std::string> m_nextBinds;

  public:
    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        SqlStandardLogger::OnError(errorInfo, sourceLocation);
        if (m_pending)
            WriteMessage("  Query: {}", m_pending->query);
        m_pending.reset();
        m_nextBinds.clear();
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        WriteMessage("Connection {} opened: {}", connection.ConnectionId(), connection.ConnectionString().Sanitized());
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        Flush();
        WriteMessage("Connection {} closed.", connection.ConnectionId());
    }

    void OnExecuteDirect(std::string_view query) override
    {
        Start(query);
    }

    void OnPrepare(std::string_view /*query*/) override
    {
        Flush();
        m_nextBinds.clear();
    }

    void OnBind(std::string value) override
    {
        m_nextBinds.emplace_back(std::move(value));
    }

    void OnExecute(std::string_view query) override
    {
        Start(query);
        m_pending->binds = std::exchange(m_nextBinds, {});
    }

    void OnFetchRow() override
    {
        if (m_pending)
            ++m_pending->rowCount;
    }

    void OnFetchEnd() override
    {
        Flush();
    }

    void OnTransaction(SqlConnection const& connection, TransactionEvent event) override
    {
        Flush();
        WriteMessage("Connection {}: {}", connection.ConnectionId(), event);
    }

    void OnDeferredLookupResolved(std::string_view entityName, std::string_view key) override
    {
        WriteMessage("Resolved {} reference to key {}", entityName, key);
    }

    void OnEntityGenerated(std::string_view entityName) override
    {
        WriteMessage("Generated entity {}", entityName);
    }

  private:
    void Start(std::string_view query)
    {
        Flush();
        m_pending = PendingStatement { .query = std::string(query) };
    }

    void Flush()
    {
        if (!m_pending)
            return;

        auto const duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now()
                                                                                     - m_pending->startedAt);
        auto const rows = m_pending->rowCount == 1 ? std::string(" [1 row]")
                          : m_pending->rowCount > 1 ? std::format(" [{} rows]", m_pending->rowCount)
                                                    : std::string();
        if (m_pending->binds.empty())
            WriteMessage("[{}]{} {}", duration, rows, m_pending->query);
        else
            WriteMessage("[{}]{} {} WITH [{}]", duration, rows, m_pending->query, JoinBinds(m_pending->binds));
        m_pending.reset();
    }

    static std::string JoinBinds(std::vector<std::string> const& binds)
    {
        auto text = std::string {};
        for (auto const& [index, value]: binds | std::views::enumerate)
            text += std::format("{}{}", index ? ", " : "", value);
        return text;
    }
};

SqlLogger* theDefaultLogger = &SqlLogger::NullLogger();

} // namespace

SqlLogger& SqlLogger::NullLogger() noexcept
{
    static SqlLogger theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::StandardLogger()
{
    static SqlStandardLogger theStandardLogger {};
    return theStandardLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static SqlTraceLogger theTraceLogger {};
    return theTraceLogger;
}

SqlLogger& SqlLogger::GetLogger()
{
    return *theDefaultLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theDefaultLogger = &logger;
}
