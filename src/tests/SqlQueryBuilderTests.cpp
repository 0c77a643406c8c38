// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Refract/SqlQuery.hpp>
#include <Refract/SqlQueryFormatter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace
{

struct QueryExpectations
{
    std::string_view sqlite;
    std::string_view postgres;
    std::string_view sqlServer;

    static QueryExpectations All(std::string_view query)
    {
        return { .sqlite = query, .postgres = query, .sqlServer = query };
    }
};

// Collapses whitespace runs, so expectations can be laid out over several lines.
[[nodiscard]] std::string NormalizeText(std::string_view text)
{
    auto result = std::string {};
    for (char const c: text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            result += c;
        else if (!result.empty() && result.back() != ' ')
            result += ' ';
    }
    if (!result.empty() && result.back() == ' ')
        result.pop_back();
    return result;
}

using QueryComposer = std::function<SqlBoundQuery(SqlQueryBuilder const&)>;

void CheckSqlQueryBuilder(std::string_view table,
                          QueryComposer const& compose,
                          QueryExpectations const& expectations,
                          std::vector<SqlVariant> const& expectedBindings = {},
                          std::source_location location = std::source_location::current())
{
    INFO(std::format("Called from {}:{}", location.file_name(), location.line()));

    auto const checkOne = [&](SqlQueryFormatter const& formatter, std::string_view name, std::string_view expected) {
        INFO("Dialect: " << name);
        auto const query = compose(SqlQueryBuilder { formatter, std::string(table) });
        CHECK(NormalizeText(query.sql) == NormalizeText(expected));
        CHECK(query.bindings == expectedBindings);
    };

    checkOne(SqlQueryFormatter::Sqlite(), "SQLite", expectations.sqlite);
    checkOne(SqlQueryFormatter::PostgrSQL(), "PostgreSQL", expectations.postgres);
    checkOne(SqlQueryFormatter::SqlServer(), "SQL Server", expectations.sqlServer);
}

} // namespace

TEST_CASE("SqlQueryBuilder.Select.Count", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) { return q.Select().Count(); },
        QueryExpectations::All(R"(SELECT COUNT(*) FROM "users")"));

    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) {
            return q.Select().Field({ .tableName = "users", .columnName = "id" }).Where(R"("age" > ?)", { 30 }).Count();
        },
        QueryExpectations::All(R"(SELECT COUNT(*) FROM "users" WHERE ("age" > ?))"),
        { SqlVariant { 30 } });
}

TEST_CASE("SqlQueryBuilder.Select.All", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) { return q.Select().All(); },
        QueryExpectations::All(R"(SELECT * FROM "users")"));

    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) { return q.Select().Distinct().Fields({ "name", "age" }, "users").All(); },
        QueryExpectations::All(R"(SELECT DISTINCT "users"."name", "users"."age" FROM "users")"));
}

TEST_CASE("SqlQueryBuilder.Select.Where conditions are parenthesized and AND-ed", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "posts",
        [](SqlQueryBuilder const& q) {
            return q.Select()
                .Where(R"("published" = ? OR "views" > ?)", { true, 100LL })
                .Where(R"("author_id" IS NOT NULL)")
                .Where(R"("title" = ?)", { "Hello" })
                .All();
        },
        QueryExpectations::All(R"(SELECT * FROM "posts"
                                  WHERE ("published" = ? OR "views" > ?) AND ("author_id" IS NOT NULL) AND ("title" = ?))"),
        { SqlVariant { true }, SqlVariant { 100LL }, SqlVariant { "Hello" } });
}

TEST_CASE("SqlQueryBuilder.Select.GroupBy and Having", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "posts",
        [](SqlQueryBuilder const& q) {
            return q.Select()
                .Field({ .tableName = "posts", .columnName = "author_id" })
                .FieldExpressionAs(R"(SUM("views"))", "views_sum")
                .Where(R"("published" = ?)", { true })
                .GroupBy("author_id")
                .Having(R"(COUNT(*) > 1)")
                .Having(R"(SUM("views") >= 10)")
                .OrderByExpression(R"(SUM("views"))", SqlResultOrdering::DESCENDING)
                .All();
        },
        QueryExpectations::All(R"(SELECT "posts"."author_id", SUM("views") AS "views_sum" FROM "posts"
                                  WHERE ("published" = ?)
                                  GROUP BY "author_id"
                                  HAVING COUNT(*) > 1 AND SUM("views") >= 10
                                  ORDER BY SUM("views") DESC)"),
        { SqlVariant { true } });
}

TEST_CASE("SqlQueryBuilder.Select.OrderBy nulls", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) {
            return q.Select()
                .OrderBy({ .tableName = "users", .columnName = "age" },
                         SqlResultOrdering::ASCENDING,
                         SqlNullsOrdering::LAST)
                .OrderBy({ .tableName = "users", .columnName = "id" }, SqlResultOrdering::DESCENDING)
                .All();
        },
        QueryExpectations {
            .sqlite = R"(SELECT * FROM "users" ORDER BY "users"."age" ASC NULLS LAST, "users"."id" DESC)",
            .postgres = R"(SELECT * FROM "users" ORDER BY "users"."age" ASC NULLS LAST, "users"."id" DESC)",
            .sqlServer = R"(SELECT * FROM "users"
                            ORDER BY CASE WHEN "users"."age" IS NULL THEN 1 ELSE 0 END, "users"."age" ASC,
                                     "users"."id" DESC)",
        });
}

TEST_CASE("SqlQueryBuilder.Select.Range", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "posts",
        [](SqlQueryBuilder const& q) {
            return q.Select()
                .Field({ .tableName = "posts", .columnName = "id" })
                .OrderBy({ .tableName = "posts", .columnName = "id" })
                .Range(20, 10);
        },
        QueryExpectations {
            .sqlite = R"(SELECT "posts"."id" FROM "posts" ORDER BY "posts"."id" ASC LIMIT 10 OFFSET 20)",
            .postgres = R"(SELECT "posts"."id" FROM "posts" ORDER BY "posts"."id" ASC LIMIT 10 OFFSET 20)",
            .sqlServer = R"(SELECT "posts"."id" FROM "posts" ORDER BY "posts"."id" ASC
                            OFFSET 20 ROWS FETCH NEXT 10 ROWS ONLY)",
        });
}

TEST_CASE("SqlQueryBuilder.Select.Range without order or limit", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "posts",
        [](SqlQueryBuilder const& q) { return q.Select().Where(R"("views" > ?)", { 1LL }).Range(5, std::nullopt); },
        QueryExpectations {
            .sqlite = R"(SELECT * FROM "posts" WHERE ("views" > ?) LIMIT -1 OFFSET 5)",
            .postgres = R"(SELECT * FROM "posts" WHERE ("views" > ?) OFFSET 5)",
            .sqlServer = R"(SELECT * FROM "posts" WHERE ("views" > ?) ORDER BY (SELECT NULL) OFFSET 5 ROWS)",
        },
        { SqlVariant { 1LL } });
}

TEST_CASE("SqlQueryBuilder.Insert", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "users",
        [](SqlQueryBuilder const& q) {
            return q.Insert().Set("email", "bob@example.com").Set("age", 42).Set("bio", SqlNullValue).Compose();
        },
        QueryExpectations::All(R"(INSERT INTO "users" ("email", "age", "bio") VALUES (?, ?, NULL))"),
        { SqlVariant { "bob@example.com" }, SqlVariant { 42 } });

    CheckSqlQueryBuilder(
        "counters",
        [](SqlQueryBuilder const& q) { return q.Insert().Compose(); },
        QueryExpectations::All(R"(INSERT INTO "counters" DEFAULT VALUES)"));
}

TEST_CASE("SqlQueryBuilder.Update binds assignments ahead of conditions", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "posts",
        [](SqlQueryBuilder const& q) {
            return q.Update()
                .Where(R"("id" = ?)", { 3 })
                .Set("title", "Hello")
                .SetExpression("views", R"("views" + ?)", { 5LL })
                .Set("content", SqlNullValue)
                .Compose();
        },
        QueryExpectations::All(
            R"(UPDATE "posts" SET "title" = ?, "views" = "views" + ?, "content" = NULL WHERE ("id" = ?))"),
        { SqlVariant { "Hello" }, SqlVariant { 5LL }, SqlVariant { 3 } });
}

TEST_CASE("SqlQueryBuilder.Delete", "[SqlQueryBuilder]")
{
    CheckSqlQueryBuilder(
        "comments",
        [](SqlQueryBuilder const& q) { return q.Delete().Where(R"("post_id" = ?)", { 9 }).Compose(); },
        QueryExpectations::All(R"(DELETE FROM "comments" WHERE ("post_id" = ?))"),
        { SqlVariant { 9 } });

    CheckSqlQueryBuilder(
        "comments",
        [](SqlQueryBuilder const& q) { return q.Delete().Compose(); },
        QueryExpectations::All(R"(DELETE FROM "comments")"));
}

TEST_CASE("SqlQueryFormatter.StringMatchPattern escapes wildcards", "[SqlQueryBuilder]")
{
    auto const& sqlite = SqlQueryFormatter::Sqlite();
    CHECK(sqlite.StringMatchPattern(SqlStringMatch::CONTAINS, "50%_off", true) == R"(%50\%\_off%)");
    CHECK(sqlite.StringMatchPattern(SqlStringMatch::STARTS_WITH, "a*b?", false) == "a[*]b[?]*");
    CHECK(sqlite.StringMatchPattern(SqlStringMatch::ENDS_WITH, "[x]", false) == "*[[]x]");

    CHECK(SqlQueryFormatter::SqlServer().StringMatchPattern(SqlStringMatch::CONTAINS, "[a]", false) == R"(%\[a]%)");
    CHECK(SqlQueryFormatter::PostgrSQL().StringMatchPattern(SqlStringMatch::STARTS_WITH, "a_b", true) == R"(a\_b%)");
}

TEST_CASE("SqlQueryFormatter.Get", "[SqlQueryBuilder]")
{
    CHECK(SqlQueryFormatter::Get(SqlServerType::SQLITE) == &SqlQueryFormatter::Sqlite());
    CHECK(SqlQueryFormatter::Get(SqlServerType::POSTGRESQL) == &SqlQueryFormatter::PostgrSQL());
    CHECK(SqlQueryFormatter::Get(SqlServerType::MICROSOFT_SQL) == &SqlQueryFormatter::SqlServer());
    CHECK(SqlQueryFormatter::Get(SqlServerType::ORACLE) == nullptr);
}
