// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Refract/Error.hpp>
#include <Refract/Key/EntityKey.hpp>
#include <Refract/Key/KeyTypeRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <format>
#include <string>
#include <unordered_set>

using namespace Refract;

TEST_CASE("EntityKey.Parse: picks the narrowest integer type", "[EntityKey]")
{
    CHECK(EntityKey::Parse("42").Is<signed char>());
    CHECK(EntityKey::Parse("-5").Is<signed char>());
    CHECK(EntityKey::Parse("200").Is<short>());
    CHECK(EntityKey::Parse("40000").Is<int>());
    CHECK(EntityKey::Parse("3000000000").Is<long long>());
    CHECK(EntityKey::Parse("18446744073709551615").Is<unsigned long long>());

    CHECK(EntityKey::Parse("40000").TryGet<int>() == 40000);
}

TEST_CASE("EntityKey.Parse: integer text too large for 64 bits stays text", "[EntityKey]")
{
    auto const key = EntityKey::Parse("99999999999999999999");
    REQUIRE(key.Is<std::string>());
    CHECK(key.TryGet<std::string>() == "99999999999999999999");
}

TEST_CASE("EntityKey.Parse: non-integer text", "[EntityKey]")
{
    CHECK(EntityKey::Parse("3.5").Is<float>());
    CHECK(EntityKey::Parse("true").TryGet<bool>() == true);
    CHECK(EntityKey::Parse("false").TryGet<bool>() == false);
    CHECK(EntityKey::Parse("alice@example.com").Is<std::string>());
    CHECK(EntityKey::Parse("").Is<std::string>());

    auto const guidText = std::string_view { "4A3B2C1D-0000-4000-8000-00AABBCCDDEE" };
    auto const key = EntityKey::Parse(guidText);
    REQUIRE(key.Is<SqlGuid>());
    CHECK(key.TryGet<SqlGuid>() == SqlGuid::TryParse(guidText));
}

TEST_CASE("EntityKey: round trip through SqlVariant", "[EntityKey]")
{
    auto const date = SqlDate { std::chrono::year { 2024 }, std::chrono::month { 5 }, std::chrono::day { 17 } };
    auto const time = SqlTime { std::chrono::hours { 8 }, std::chrono::minutes { 30 }, std::chrono::seconds { 15 } };

    for (auto const& key: { EntityKey { static_cast<signed char>(-7) },
                            EntityKey { static_cast<short>(700) },
                            EntityKey { 7 },
                            EntityKey { 7LL },
                            EntityKey { static_cast<unsigned char>(7) },
                            EntityKey { static_cast<unsigned short>(40000) },
                            EntityKey { 7U },
                            EntityKey { 7ULL },
                            EntityKey { 2.5F },
                            EntityKey { 2.5 },
                            EntityKey { std::string("seven") },
                            EntityKey { true },
                            EntityKey { SqlGuid::Create() },
                            EntityKey { date },
                            EntityKey { time },
                            EntityKey { SqlDateTime { date, time, std::chrono::milliseconds { 250 } } } })
    {
        INFO(key.ToString());
        CHECK(EntityKey::FromSqlVariant(key.ToSqlVariant()) == key);
    }

    // The integer width and signedness are part of the key.
    CHECK(EntityKey { 7 } != EntityKey { 7LL });
    CHECK(EntityKey { 7 } != EntityKey { 7U });
    CHECK(EntityKey { 2.5F } != EntityKey { 2.5 });
}

TEST_CASE("EntityKey.FromSqlVariant: NULL is rejected", "[EntityKey]")
{
    CHECK_THROWS_AS(EntityKey::FromSqlVariant(SqlVariant { SqlNullValue }), KeyConversionError);
}

TEST_CASE("EntityKey.ConvertTo", "[EntityKey]")
{
    CHECK(EntityKey { 7LL }.ConvertTo(FieldType::Int32) == SqlVariant { 7 });
    CHECK(EntityKey { 7 }.ConvertTo(FieldType::Int64) == SqlVariant { 7LL });
    CHECK(EntityKey { std::string("42") }.ConvertTo(FieldType::Int64) == SqlVariant { 42LL });
    CHECK(EntityKey { 7 }.ConvertTo(FieldType::String) == SqlVariant { "7" });
    CHECK(EntityKey { 1 }.ConvertTo(FieldType::Bool) == SqlVariant { true });
    CHECK(EntityKey { 3 }.ConvertTo(FieldType::Float64) == SqlVariant { 3.0 });
    CHECK(EntityKey { 3 }.ConvertTo(FieldType::Float32) == SqlVariant { 3.0F });
    CHECK(EntityKey { 2.5 }.ConvertTo(FieldType::Float32) == SqlVariant { 2.5F });
    CHECK(EntityKey { std::string("2.5") }.ConvertTo(FieldType::Float32) == SqlVariant { 2.5F });

    // Json and opaque fields take the key as it is.
    CHECK(EntityKey { 7 }.ConvertTo(FieldType::Json) == SqlVariant { 7 });
    CHECK(EntityKey { std::string("x") }.ConvertTo(FieldType::Opaque) == SqlVariant { "x" });
}

TEST_CASE("EntityKey.ConvertTo: dates and timestamps", "[EntityKey]")
{
    auto const date = SqlDate { std::chrono::year { 2024 }, std::chrono::month { 5 }, std::chrono::day { 17 } };
    auto const time = SqlTime { std::chrono::hours { 8 }, std::chrono::minutes { 30 }, std::chrono::seconds { 0 } };
    auto const dateTime = SqlDateTime { date, time };

    CHECK(EntityKey { date }.ConvertTo(FieldType::Date) == SqlVariant { date });
    CHECK(EntityKey { "2024-05-17" }.ConvertTo(FieldType::Date) == SqlVariant { date });
    CHECK(EntityKey { dateTime }.ConvertTo(FieldType::Date) == SqlVariant { date });

    CHECK(EntityKey { dateTime }.ConvertTo(FieldType::DateTime) == SqlVariant { dateTime });
    CHECK(EntityKey { "2024-05-17 08:30:00" }.ConvertTo(FieldType::DateTime) == SqlVariant { dateTime });
    CHECK(EntityKey { "2024-05-17T08:30:00" }.ConvertTo(FieldType::DateTime) == SqlVariant { dateTime });
    CHECK(EntityKey { "2024-05-17 08:30:00.5" }.ConvertTo(FieldType::DateTime)
          == SqlVariant { SqlDateTime { date, time, std::chrono::milliseconds { 500 } } });

    // A date widens to midnight of that day.
    CHECK(EntityKey { date }.ConvertTo(FieldType::DateTime) == SqlVariant { SqlDateTime { date, SqlTime {} } });

    CHECK(EntityKey { "08:30:00" }.ConvertTo(FieldType::Time) == SqlVariant { time });
}

TEST_CASE("EntityKey.ConvertTo: values that do not fit", "[EntityKey]")
{
    CHECK_THROWS_AS(EntityKey { "abc" }.ConvertTo(FieldType::Float32), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { true }.ConvertTo(FieldType::Float32), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { "2024-13-01" }.ConvertTo(FieldType::Date), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { 20240517 }.ConvertTo(FieldType::Date), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { "2024-05-17" }.ConvertTo(FieldType::DateTime), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { 300 }.ConvertTo(FieldType::Int8), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { -1 }.ConvertTo(FieldType::UInt32), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { "abc" }.ConvertTo(FieldType::Int32), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { 2 }.ConvertTo(FieldType::Bool), KeyConversionError);
    CHECK_THROWS_AS(EntityKey { "not-a-uuid" }.ConvertTo(FieldType::Uuid), KeyConversionError);
}

TEST_CASE("EntityKey: hashing and formatting", "[EntityKey]")
{
    auto keys = std::unordered_set<EntityKey> {};
    keys.insert(EntityKey { 1 });
    keys.insert(EntityKey { 1 });
    keys.insert(EntityKey { "1" });
    CHECK(keys.size() == 2);

    CHECK(std::format("{}", EntityKey { 42 }) == "42");
    CHECK(std::format("{}", EntityKey { "alice" }) == "alice");
}

TEST_CASE("KeyTypeRegistry: entity names are matched unqualified and case-insensitively", "[KeyTypeRegistry]")
{
    auto registry = KeyTypeRegistry {};
    registry.Register("blog::User", "id", FieldType::Int32);

    CHECK(registry.FieldTypeOf("User", "id") == FieldType::Int32);
    CHECK(registry.FieldTypeOf("USER", "id") == FieldType::Int32);
    CHECK(registry.FieldTypeOf("other::user", "id") == FieldType::Int32);
    CHECK(!registry.FieldTypeOf("User", "email").has_value());
    CHECK(!registry.FieldTypeOf("Post", "id").has_value());

    CHECK(registry.ConvertKey(EntityKey { 5LL }, "user", "id") == SqlVariant { 5 });
}

TEST_CASE("KeyTypeRegistry: unknown fields keep the key type", "[KeyTypeRegistry]")
{
    auto const registry = KeyTypeRegistry {};
    CHECK(registry.ConvertKey(EntityKey { 5LL }, "User", "id") == SqlVariant { 5LL });
    CHECK(registry.ConvertKey(EntityKey { "x" }, "User", "id") == SqlVariant { "x" });
}

TEST_CASE("KeyTypeRegistry: registers primary and foreign keys of an entity", "[KeyTypeRegistry]")
{
    auto const post = EntityInfo {
        .name = "Post",
        .tableName = "posts",
        .fields = { FieldInfo { .name = "id", .columnName = "id", .type = FieldType::Int64, .primaryKey = true },
                    FieldInfo { .name = "title", .columnName = "title", .type = FieldType::String },
                    FieldInfo { .name = "author_id",
                                .columnName = "author_id",
                                .type = FieldType::Int32,
                                .nullable = true } },
        .relations = {},
        .foreignKeys = { ForeignKeyInfo { .fieldName = "author_id", .type = FieldType::Int32 } },
    };

    auto registry = KeyTypeRegistry {};
    registry.Register(post);

    CHECK(registry.FieldTypeOf("Post", "id") == FieldType::Int64);
    CHECK(registry.FieldTypeOf("Post", "author_id") == FieldType::Int32);
    CHECK(!registry.FieldTypeOf("Post", "title").has_value());

    CHECK_THROWS_AS(registry.ConvertKey(EntityKey { "abc" }, "Post", "author_id"), KeyConversionError);
}
