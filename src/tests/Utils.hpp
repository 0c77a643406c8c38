// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <Refract/DataBinder/SqlVariant.hpp>
#include <Refract/Query/SqlRecord.hpp>
#include <Refract/SqlConnectInfo.hpp>
#include <Refract/SqlConnection.hpp>
#include <Refract/SqlLogger.hpp>
#include <Refract/SqlStatement.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <format>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

/// Each connection to this data source opens a fresh, private in-memory SQLite database.
inline SqlConnectionString DefaultTestConnectionString()
{
#if defined(_WIN32) || defined(_WIN64)
    return SqlConnectionString { .value = "DRIVER=SQLite3 ODBC Driver;Database=file::memory:" };
#else
    return SqlConnectionString { .value = "DRIVER=SQLite3;Database=file::memory:" };
#endif
}

/// Reports statements as unscoped Catch2 messages, so a failing test shows the SQL that led to it.
class TestSuiteSqlLogger: public SqlLogger
{
  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnWarning(std::string_view message) override
    {
        WARN(message);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WARN(std::format("SQL error: {}", errorInfo));
        Report("  at {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!m_lastQuery.empty())
            Report("  while running: {}", m_lastQuery);

#if __has_include(<stacktrace>)
        for (auto const& [i, frame]: std::views::enumerate(std::stacktrace::current(1, 16)))
            Report("    #{} {}", i, frame);
#endif
    }

    void OnExecuteDirect(std::string_view query) override
    {
        m_lastQuery = query;
        Report("direct: {}", query);
    }

    void OnPrepare(std::string_view query) override
    {
        m_lastQuery = query;
    }

    void OnBind(std::string value) override
    {
        m_bindings.push_back(std::move(value));
    }

    void OnExecute(std::string_view query) override
    {
        Report("execute: {} [{}]", query, Join(m_bindings));
        m_bindings.clear();
    }

    void OnTransaction(SqlConnection const& /*connection*/, TransactionEvent event) override
    {
        Report("{}", event);
    }

    void OnRecordNotFound(std::string_view entityName, std::string_view condition) override
    {
        Report("no {} matches {}", entityName, condition);
    }

  private:
    static std::string Join(std::vector<std::string> const& values)
    {
        auto result = std::string {};
        for (auto const& value: values)
            result += result.empty() ? value : ", " + value;
        return result;
    }

    template <typename... Args>
    static void Report(std::format_string<Args...> fmt, Args&&... args)
    {
        UNSCOPED_INFO(std::format(fmt, std::forward<Args>(args)...));
    }

    std::string m_lastQuery;
    std::vector<std::string> m_bindings;
};

/// Installs a logger for the lifetime of the scope, and restores the previous one afterwards.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlLogger: public SqlLogger
{
  public:
    ScopedSqlLogger():
        m_previous { SqlLogger::GetLogger() }
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlLogger() override
    {
        SqlLogger::SetLogger(m_previous);
    }

  private:
    SqlLogger& m_previous;
};

/// Silences the error reporting of tests that provoke errors on purpose.
using ScopedSqlNullLogger = ScopedSqlLogger;

/// Collects the entity layer events raised within the scope.
class ScopedEntityEventRecorder final: public ScopedSqlLogger
{
  public:
    struct Event
    {
        std::string entityName;
        std::string detail;
    };

    std::vector<Event> recordsNotFound;
    std::vector<Event> lookupsResolved;
    std::vector<std::string> entitiesGenerated;
    size_t rollbacks = 0;

    void OnTransaction(SqlConnection const& /*connection*/, TransactionEvent event) override
    {
        if (event == TransactionEvent::Rollback)
            ++rollbacks;
    }

    void OnRecordNotFound(std::string_view entityName, std::string_view condition) override
    {
        recordsNotFound.push_back(Event { .entityName = std::string(entityName), .detail = std::string(condition) });
    }

    void OnDeferredLookupResolved(std::string_view entityName, std::string_view key) override
    {
        lookupsResolved.push_back(Event { .entityName = std::string(entityName), .detail = std::string(key) });
    }

    void OnEntityGenerated(std::string_view entityName) override
    {
        entitiesGenerated.emplace_back(entityName);
    }
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class SqlTestFixture
{
  public:
    using MainProgramArgs = std::tuple<int, char**>;

    /// Consumes the test suite's own leading options and configures the data source.
    ///
    /// Returns the arguments left for Catch2, or the exit code if the program should stop.
    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        SqlLogger::SetLogger(TestSuiteSqlLogger::GetLogger());

        auto connectionString = std::optional<SqlConnectionString> {};
        if (auto const* env = std::getenv("REFRACT_TEST_CONNECTION_STRING"); env && *env) // NOLINT(concurrency-mt-unsafe)
            connectionString = SqlConnectionString { .value = env };

        int consumed = 0;
        while (consumed + 1 < argc)
        {
            auto const option = std::string_view { argv[consumed + 1] };
            if (option == "--trace-sql")
                SqlLogger::SetLogger(SqlLogger::TraceLogger());
            else if (option.starts_with("--test-env="))
                connectionString = SqlConnectionString { .value = std::string(option.substr(option.find('=') + 1)) };
            else if (option == "--help" || option == "-h")
            {
                std::println("Usage: {} [--trace-sql] [--test-env=CONNECTION_STRING] [--] [Catch2 options]", argv[0]);
                return EXIT_SUCCESS;
            }
            else
            {
                consumed += option == "--" ? 1 : 0;
                break;
            }
            ++consumed;
        }

        SqlConnection::SetDefaultConnectionString(connectionString.value_or(DefaultTestConnectionString()));
        SqlConnection::SetPostConnectedHook([](SqlConnection& connection) {
            if (connection.ServerType() == SqlServerType::SQLITE)
                SqlStatement { connection }.ExecuteDirect("PRAGMA foreign_keys = ON");
        });

        auto connection = SqlConnection {};
        if (!connection.IsAlive())
        {
            std::println("Cannot connect to {}: {}",
                         connectionString.value_or(DefaultTestConnectionString()).Sanitized(),
                         connection.LastError());
            return EXIT_FAILURE;
        }
        std::println("Testing against {} {}", connection.ServerName(), connection.ServerVersion());

        // Catch2 reads the program name from the slot right before its first argument.
        argv[consumed] = argv[0];
        return MainProgramArgs { argc - consumed, argv + consumed };
    }

    // An in-memory SQLite database lives as long as its connection, so every test holds exactly one.
    SqlTestFixture()
    {
        REQUIRE(m_connection.IsAlive());
        DropBlogTables();
    }

    virtual ~SqlTestFixture() = default;

    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return m_connection;
    }

    /// Column type of an auto-incrementing integer primary key.
    [[nodiscard]] std::string_view PrimaryKeyAutoIncrement() const noexcept
    {
        switch (m_connection.ServerType())
        {
            case SqlServerType::MICROSOFT_SQL:
                return "INT IDENTITY(1,1) PRIMARY KEY";
            case SqlServerType::POSTGRESQL:
                return "SERIAL PRIMARY KEY";
            case SqlServerType::MYSQL:
                return "INT AUTO_INCREMENT PRIMARY KEY";
            case SqlServerType::ORACLE:
                return "NUMBER GENERATED BY DEFAULT ON NULL AS IDENTITY PRIMARY KEY";
            case SqlServerType::SQLITE:
            case SqlServerType::UNKNOWN:
                break;
        }
        return "INTEGER PRIMARY KEY AUTOINCREMENT";
    }

    [[nodiscard]] std::string_view BooleanType() const noexcept
    {
        return m_connection.ServerType() == SqlServerType::MICROSOFT_SQL ? "BIT" : "BOOLEAN";
    }

    /// Creates the tables of the blog schema: users, their posts and profiles, and the comments on posts.
    void CreateBlogTables()
    {
        auto const key = PrimaryKeyAutoIncrement();
        RunAll({
            std::format(R"SQL(CREATE TABLE "users" (
                                  "id" {},
                                  "email" VARCHAR(100) NOT NULL UNIQUE,
                                  "name" VARCHAR(100) NOT NULL,
                                  "age" INTEGER NULL
                              ))SQL",
                        key),
            std::format(R"SQL(CREATE TABLE "posts" (
                                  "id" {},
                                  "title" VARCHAR(200) NOT NULL,
                                  "content" VARCHAR(1000) NULL,
                                  "published" {} NOT NULL,
                                  "views" BIGINT NOT NULL,
                                  "author_id" INTEGER NULL REFERENCES "users" ("id") ON DELETE SET NULL
                              ))SQL",
                        key,
                        BooleanType()),
            std::format(R"SQL(CREATE TABLE "comments" (
                                  "id" {},
                                  "body" VARCHAR(500) NOT NULL,
                                  "post_id" INTEGER NOT NULL REFERENCES "posts" ("id") ON DELETE CASCADE
                              ))SQL",
                        key),
            std::format(R"SQL(CREATE TABLE "profiles" (
                                  "id" {},
                                  "user_id" INTEGER NOT NULL UNIQUE REFERENCES "users" ("id"),
                                  "bio" VARCHAR(500) NOT NULL
                              ))SQL",
                        key),
        });
    }

    void DropBlogTables()
    {
        // Dependent tables go first.
        RunAll({ R"(DROP TABLE IF EXISTS "profiles")",
                 R"(DROP TABLE IF EXISTS "comments")",
                 R"(DROP TABLE IF EXISTS "posts")",
                 R"(DROP TABLE IF EXISTS "users")" });
    }

    /// Number of rows in the table, read without going through the entity layer.
    [[nodiscard]] size_t CountRows(std::string_view table)
    {
        auto const count = SqlStatement { m_connection }.ExecuteDirectScalar<size_t>(
            std::format(R"(SELECT COUNT(*) FROM "{}")", table));
        return count.value_or(0);
    }

  protected:
    SqlConnection m_connection;

  private:
    void RunAll(std::vector<std::string> const& statements)
    {
        auto stmt = SqlStatement { m_connection };
        for (auto const& sql: statements)
            stmt.ExecuteDirect(sql);
    }
};

inline std::ostream& operator<<(std::ostream& os, SqlVariant const& value)
{
    return os << std::format("SqlVariant {{ {} }}", value);
}

namespace Refract
{

inline std::ostream& operator<<(std::ostream& os, SqlRecord const& record)
{
    return os << record.ToString();
}

} // namespace Refract
