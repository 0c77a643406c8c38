// SPDX-License-Identifier: Apache-2.0

#include "../examples/blog/BlogSchema.hpp"
#include "BlogModel.hpp"
#include "Utils.hpp"

#include <Refract/Error.hpp>
#include <Refract/Predicate/PredicateCompiler.hpp>
#include <Refract/Schema/SchemaAnalyzer.hpp>
#include <Refract/SqlQueryFormatter.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace Refract;

namespace
{

EntityCatalog const& BlogCatalog()
{
    static auto const catalog = [] {
        auto result = EntityCatalog {};
        for (auto& entity: CompileSchema(blog::BlogSchema()))
            (void) result.Add(std::move(entity));

        // An entity with a JSON column, to exercise the JSON operators.
        (void) result.Add(EntityInfo {
            .name = "Document",
            .tableName = "documents",
            .fields = { FieldInfo { .name = "id", .columnName = "id", .type = FieldType::Int32, .unique = true, .primaryKey = true },
                        FieldInfo { .name = "settings", .columnName = "settings", .type = FieldType::Json, .nullable = true } },
            .relations = {},
            .foreignKeys = {},
        });
        return result;
    }();
    return catalog;
}

struct CompiledCondition
{
    std::string sql;
    std::vector<SqlVariant> bindings;
};

CompiledCondition CompileAndRender(std::string_view entityName,
                                   std::vector<Predicate> const& predicates,
                                   SqlQueryFormatter const& formatter = SqlQueryFormatter::Sqlite())
{
    auto const& catalog = BlogCatalog();
    auto const& entity = catalog.Require(entityName);
    auto const condition = PredicateCompiler { catalog }.Compile(entity, predicates, entity.tableName);

    auto result = CompiledCondition {};
    result.sql = RenderCondition(condition, formatter, result.bindings);
    return result;
}

} // namespace

TEST_CASE("PredicateCompiler: empty where-list matches every row", "[PredicateCompiler]")
{
    auto const compiled = CompileAndRender("User", {});
    CHECK(compiled.sql == "1 = 1");
    CHECK(compiled.bindings.empty());
}

TEST_CASE("PredicateCompiler: field predicates are AND-ed", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    auto const single = CompileAndRender("User", { email::Equals("alice@example.com") });
    CHECK(single.sql == R"("users"."email" = ?)");
    CHECK(single.bindings == std::vector { SqlVariant { "alice@example.com" } });

    auto const both = CompileAndRender("User", { name::Equals("Alice"), age::GreaterThan(18) });
    CHECK(both.sql == R"(("users"."name" = ? AND "users"."age" > ?))");
    CHECK(both.bindings == std::vector { SqlVariant { "Alice" }, SqlVariant { 18 } });
}

TEST_CASE("PredicateCompiler: comparison operators", "[PredicateCompiler]")
{
    using namespace blog::post::where;

    auto const compiled = CompileAndRender("Post",
                                           { views::GreaterOrEqual(10),
                                             views::LessOrEqual(100),
                                             views::LessThan(50),
                                             title::NotEquals("Draft") });
    CHECK(compiled.sql
          == R"(("posts"."views" >= ? AND "posts"."views" <= ? AND "posts"."views" < ? AND "posts"."title" <> ?))");
    CHECK(compiled.bindings
          == std::vector { SqlVariant { 10LL }, SqlVariant { 100LL }, SqlVariant { 50LL }, SqlVariant { "Draft" } });
}

TEST_CASE("PredicateCompiler: NULL comparisons", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    CHECK(CompileAndRender("User", { age::IsNull() }).sql == R"("users"."age" IS NULL)");
    CHECK(CompileAndRender("User", { age::IsNotNull() }).sql == R"("users"."age" IS NOT NULL)");

    auto const equalsNull = CompileAndRender(
        "User",
        { FieldPredicate { .field = "age", .op = FieldOperator::Equals, .values = { SqlVariant { SqlNullValue } } } });
    CHECK(equalsNull.sql == R"("users"."age" IS NULL)");
    CHECK(equalsNull.bindings.empty());

    auto const notEqualsNull = CompileAndRender(
        "User",
        { FieldPredicate { .field = "age", .op = FieldOperator::NotEquals, .values = { SqlVariant { SqlNullValue } } } });
    CHECK(notEqualsNull.sql == R"("users"."age" IS NOT NULL)");
}

TEST_CASE("PredicateCompiler: IsNull requires a nullable field", "[PredicateCompiler]")
{
    CHECK_THROWS_AS(CompileAndRender("User", { FieldPredicate { .field = "name", .op = FieldOperator::IsNull } }),
                    QueryValidationError);
}

TEST_CASE("PredicateCompiler: operators outside the field's type class are rejected", "[PredicateCompiler]")
{
    CHECK_THROWS_AS(CompileAndRender("Post",
                                     { FieldPredicate { .field = "published",
                                                        .op = FieldOperator::GreaterThan,
                                                        .values = { SqlVariant { true } } } }),
                    QueryValidationError);
    CHECK_THROWS_AS(CompileAndRender("Post",
                                     { FieldPredicate { .field = "views",
                                                        .op = FieldOperator::Contains,
                                                        .values = { SqlVariant { "1" } } } }),
                    QueryValidationError);
    CHECK_THROWS_AS(CompileAndRender("Post", { FieldPredicate { .field = "rating" } }), QueryValidationError);
}

TEST_CASE("PredicateCompiler: set membership", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    auto const inSet = CompileAndRender("User", { id::InSet({ 1, 2, 3 }) });
    CHECK(inSet.sql == R"("users"."id" IN (?, ?, ?))");
    CHECK(inSet.bindings == std::vector { SqlVariant { 1 }, SqlVariant { 2 }, SqlVariant { 3 } });

    CHECK(CompileAndRender("User", { name::NotInSet({ "Bob" }) }).sql == R"("users"."name" NOT IN (?))");

    // An empty set contains nothing.
    CHECK(CompileAndRender("User", { id::InSet({}) }).sql == "1 = 0");
    CHECK(CompileAndRender("User", { id::NotInSet({}) }).sql == "1 = 1");
}

TEST_CASE("PredicateCompiler: string matching on SQLite", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    auto const contains = CompileAndRender("User", { name::Contains("li") });
    CHECK(contains.sql == R"("users"."name" GLOB ?)");
    CHECK(contains.bindings == std::vector { SqlVariant { "*li*" } });

    CHECK(CompileAndRender("User", { name::StartsWith("Al") }).bindings == std::vector { SqlVariant { "Al*" } });
    CHECK(CompileAndRender("User", { name::EndsWith("ce") }).bindings == std::vector { SqlVariant { "*ce" } });

    // Wildcards in the text match literally.
    CHECK(CompileAndRender("User", { name::Contains("a*b?") }).bindings == std::vector { SqlVariant { "*a[*]b[?]*" } });
}

TEST_CASE("PredicateCompiler: query mode applies to the whole list", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    // The mode is listed after the predicate it affects.
    auto const compiled = CompileAndRender("User", { name::Contains("LI"), name::Mode(QueryMode::Insensitive) });
    CHECK(compiled.sql == R"(LOWER("users"."name") LIKE LOWER(?) ESCAPE '\')");
    CHECK(compiled.bindings == std::vector { SqlVariant { "%LI%" } });

    auto const equals = CompileAndRender("User", { name::Mode(QueryMode::Insensitive), name::Equals("alice") });
    CHECK(equals.sql == R"(LOWER("users"."name") = LOWER(?))");

    // Only the field named by the mode is affected.
    auto const other = CompileAndRender("User", { name::Mode(QueryMode::Insensitive), email::Contains("x") });
    CHECK(other.sql == R"("users"."email" GLOB ?)");

    CHECK_THROWS_AS(CompileAndRender("User", { ModePredicate { .field = "age", .mode = QueryMode::Insensitive } }),
                    QueryValidationError);
}

TEST_CASE("PredicateCompiler: string matching on other servers", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    auto const postgres = CompileAndRender("User", { name::Contains("50%") }, SqlQueryFormatter::PostgrSQL());
    CHECK(postgres.sql == R"("users"."name" LIKE ? ESCAPE '\')");
    CHECK(postgres.bindings == std::vector { SqlVariant { R"(%50\%%)" } });

    auto const postgresInsensitive = CompileAndRender(
        "User", { name::Mode(QueryMode::Insensitive), name::StartsWith("al") }, SqlQueryFormatter::PostgrSQL());
    CHECK(postgresInsensitive.sql == R"("users"."name" ILIKE ? ESCAPE '\')");
    CHECK(postgresInsensitive.bindings == std::vector { SqlVariant { "al%" } });

    auto const sqlServer = CompileAndRender("User", { name::EndsWith("ce") }, SqlQueryFormatter::SqlServer());
    CHECK(sqlServer.sql == R"("users"."name" COLLATE Latin1_General_CS_AS LIKE ? ESCAPE '\')");
    CHECK(sqlServer.bindings == std::vector { SqlVariant { "%ce" } });
}

TEST_CASE("PredicateCompiler: logical combinators", "[PredicateCompiler]")
{
    using namespace blog::user::where;

    auto const either = CompileAndRender("User", { Or({ name::Equals("Alice"), name::Equals("Bob") }) });
    CHECK(either.sql == R"(("users"."name" = ? OR "users"."name" = ?))");
    CHECK(either.bindings == std::vector { SqlVariant { "Alice" }, SqlVariant { "Bob" } });

    CHECK(CompileAndRender("User", { Not({ name::Equals("Alice") }) }).sql == R"(NOT ("users"."name" = ?))");
    CHECK(CompileAndRender("User", { Not({ name::Equals("Alice"), age::IsNull() }) }).sql
          == R"(NOT (("users"."name" = ? AND "users"."age" IS NULL)))");

    CHECK(CompileAndRender("User", { And({}) }).sql == "1 = 1");
    CHECK(CompileAndRender("User", { Or({}) }).sql == "1 = 0");
}

TEST_CASE("PredicateCompiler: key predicates convert the key to the column type", "[PredicateCompiler]")
{
    auto const compiled = CompileAndRender("User", { blog::user::where::id::Equals(EntityKey { "7" }) });
    CHECK(compiled.sql == R"("users"."id" = ?)");
    CHECK(compiled.bindings == std::vector { SqlVariant { 7 } });

    CHECK_THROWS_AS(CompileAndRender("User", { blog::user::where::id::Equals(EntityKey { "seven" }) }),
                    KeyConversionError);

    // Keys select single rows, so the field must be unique.
    CHECK_THROWS_AS(CompileAndRender("User", { KeyPredicate { .field = "name", .key = EntityKey { "Alice" } } }),
                    QueryValidationError);
}

TEST_CASE("PredicateCompiler: unique selectors", "[PredicateCompiler]")
{
    auto const selector = blog::user::where::email::Unique("alice@example.com");
    CHECK(selector.ToString() == "email = alice@example.com");

    auto const compiled = CompileAndRender("User", { selector.ToPredicate() });
    CHECK(compiled.sql == R"("users"."email" = ?)");

    CHECK(blog::user::where::id::Unique(EntityKey { 3 }).ToString() == "id = 3");
}

TEST_CASE("PredicateCompiler: relation quantifiers over has-many", "[PredicateCompiler]")
{
    using namespace blog;

    auto const some = CompileAndRender("User", { user::posts::Some({ post::where::title::Contains("spam") }) });
    CHECK(some.sql
          == R"(EXISTS (SELECT 1 FROM "posts" AS "t1" WHERE "t1"."author_id" = "users"."id" AND "t1"."title" GLOB ?))");
    CHECK(some.bindings == std::vector { SqlVariant { "*spam*" } });

    auto const every = CompileAndRender("User", { user::posts::Every({ post::where::published::Equals(true) }) });
    CHECK(every.sql
          == R"(NOT EXISTS (SELECT 1 FROM "posts" AS "t1" WHERE "t1"."author_id" = "users"."id" AND NOT ("t1"."published" = ?)))");

    auto const none = CompileAndRender("User", { user::posts::None({ post::where::title::Contains("spam") }) });
    CHECK(none.sql
          == R"(NOT EXISTS (SELECT 1 FROM "posts" AS "t1" WHERE "t1"."author_id" = "users"."id" AND "t1"."title" GLOB ?))");

    // Without a filter only the join remains.
    CHECK(CompileAndRender("User", { user::posts::Some({}) }).sql
          == R"(EXISTS (SELECT 1 FROM "posts" AS "t1" WHERE "t1"."author_id" = "users"."id"))");
}

TEST_CASE("PredicateCompiler: relation quantifiers over belongs-to and has-one", "[PredicateCompiler]")
{
    using namespace blog;

    auto const author = CompileAndRender("Post", { post::author::Some({ user::where::name::Equals("Alice") }) });
    CHECK(author.sql
          == R"(EXISTS (SELECT 1 FROM "users" AS "t1" WHERE "t1"."id" = "posts"."author_id" AND "t1"."name" = ?))");

    auto const profile = CompileAndRender("User", { user::profile::None({}) });
    CHECK(profile.sql == R"(NOT EXISTS (SELECT 1 FROM "profiles" AS "t1" WHERE "t1"."user_id" = "users"."id"))");
}

TEST_CASE("PredicateCompiler: nested relations get their own aliases", "[PredicateCompiler]")
{
    using namespace blog;

    auto const compiled = CompileAndRender(
        "User",
        { user::posts::Some({ post::comments::Some({ comment::where::body::Contains("great") }) }) });
    CHECK(compiled.sql
          == R"(EXISTS (SELECT 1 FROM "posts" AS "t1" WHERE "t1"."author_id" = "users"."id" AND )"
             R"(EXISTS (SELECT 1 FROM "comments" AS "t2" WHERE "t2"."post_id" = "t1"."id" AND "t2"."body" GLOB ?)))");
}

TEST_CASE("PredicateCompiler: unknown relation", "[PredicateCompiler]")
{
    CHECK_THROWS_AS(CompileAndRender("User", { RelationPredicate { .relation = "followers" } }),
                    RelationNotFoundError);
}

TEST_CASE("PredicateCompiler: JSON operators on SQLite", "[PredicateCompiler]")
{
    auto const settings = [](FieldOperator op, std::vector<std::string> path, std::vector<SqlVariant> values = {}) {
        return FieldPredicate { .field = "settings", .op = op, .values = std::move(values), .jsonPath = std::move(path) };
    };

    auto const pathEquals =
        CompileAndRender("Document", { settings(FieldOperator::JsonPathEquals, { "theme", "0" }, { SqlVariant { "dark" } }) });
    CHECK(pathEquals.sql == R"(json_extract("documents"."settings", ?) = ?)");
    CHECK(pathEquals.bindings == std::vector { SqlVariant { R"($."theme"[0])" }, SqlVariant { "dark" } });

    auto const hasKey = CompileAndRender("Document", { settings(FieldOperator::JsonHasKey, { "theme" }) });
    CHECK(hasKey.sql == R"(json_type("documents"."settings", ?) IS NOT NULL)");
    CHECK(hasKey.bindings == std::vector { SqlVariant { R"($."theme")" } });

    auto const stringContains =
        CompileAndRender("Document", { settings(FieldOperator::JsonStringContains, { "theme" }, { SqlVariant { "ar" } }) });
    CHECK(stringContains.sql == R"(json_extract("documents"."settings", ?) GLOB ?)");
    CHECK(stringContains.bindings == std::vector { SqlVariant { R"($."theme")" }, SqlVariant { "*ar*" } });

    auto jsonNull = settings(FieldOperator::JsonNull, {});
    jsonNull.nullKind = JsonNullKind::JsonNull;
    CHECK(CompileAndRender("Document", { jsonNull }).sql == R"(json_type("documents"."settings") = 'null')");

    jsonNull.nullKind = JsonNullKind::AnyNull;
    CHECK(CompileAndRender("Document", { jsonNull }).sql
          == R"(("documents"."settings" IS NULL OR json_type("documents"."settings") = 'null'))");

    CHECK_THROWS_AS(CompileAndRender("Document", { settings(FieldOperator::JsonHasKey, {}) }), PredicateContractError);
}
