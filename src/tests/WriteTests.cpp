// SPDX-License-Identifier: Apache-2.0

#include "BlogFixture.hpp"

#include <Refract/Error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

using namespace blog;
using Refract::FieldMutation;
using Refract::MutationKind;

TEST_CASE_METHOD(BlogFixture, "Create", "[Write]")
{
    auto const created = user::Client(client)
                             .Create(User { .id = 0, .email = "dave@example.com", .name = "Dave", .age = 41 })
                             .Exec();
    CHECK(created.id > 0);
    CHECK(created.email == "dave@example.com");
    CHECK(created.age == 41);
    CHECK(CountRows("users") == 1);

    // Fields set one by one, through the untyped client.
    auto const row = client.Entity("Post")
                         .Create()
                         .Set("title", SqlVariant { "Loose" })
                         .Set("published", SqlVariant { true })
                         .Set("views", SqlVariant { 7 })
                         .Exec();
    CHECK(row.Get("title") == SqlVariant { "Loose" });
    CHECK(row.GetOrNull("author_id").IsNull());
    CHECK(row.GetOrNull("content").IsNull());
    CHECK(CountRows("posts") == 1);
}

TEST_CASE_METHOD(BlogFixture, "Create: unique constraint violations propagate", "[Write]")
{
    auto const _ = ScopedSqlNullLogger {};
    (void) CreateUser("dave@example.com", "Dave");
    CHECK_THROWS_AS(CreateUser("dave@example.com", "Other Dave"), SqlException);
    CHECK(CountRows("users") == 1);
}

TEST_CASE_METHOD(BlogFixture, "Update", "[Write]")
{
    CreateSampleBlog();

    auto const updated = user::Client(client)
                             .Update()
                             .Where(user::where::email::Equals("bob@example.com"))
                             .Mutate(user::set::name::Set("Robert"))
                             .Mutate(user::set::age::Set(52))
                             .Exec();
    CHECK(updated.id == bob.id);
    CHECK(updated.name == "Robert");
    CHECK(updated.age == 52);

    auto const reread = user::Client(client).FindUnique(user::where::id::Unique(bob.id)).Exec();
    REQUIRE(reread.has_value());
    CHECK(*reread == updated);

    // Other rows stay as they were.
    CHECK(user::Client(client).FindUnique(user::where::id::Unique(alice.id)).Exec() == alice);
}

TEST_CASE_METHOD(BlogFixture, "Update: without mutations the row is returned unchanged", "[Write]")
{
    CreateSampleBlog();

    auto const before = post::Client(client).FindUnique(post::where::id::Unique(aliceHello.id)).Exec();
    REQUIRE(before.has_value());

    auto const after = post::Client(client).Update().Where(post::where::id::Equals(aliceHello.id)).Exec();
    CHECK(after == *before);

    // Setting a field to its current value changes nothing either.
    auto const same = post::Client(client)
                          .Update()
                          .Where(post::where::id::Equals(aliceHello.id))
                          .Mutate(post::set::title::Set("Hello World"))
                          .Exec();
    CHECK(same == *before);
}

TEST_CASE_METHOD(BlogFixture, "Update: arithmetic mutations", "[Write]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);
    auto const where = post::where::id::Equals(aliceHello.id);

    CHECK(posts.Update().Where(where).Mutate(post::set::views::Increment(10)).Exec().views == 110);
    CHECK(posts.Update().Where(where).Mutate(post::set::views::Decrement(30)).Exec().views == 80);
    CHECK(posts.Update().Where(where).Mutate(post::set::views::Multiply(2)).Exec().views == 160);
    CHECK(posts.Update().Where(where).Mutate(post::set::views::Divide(3)).Exec().views == 53);

    // Mutations apply in order.
    auto const chained = posts.Update()
                             .Where(where)
                             .Data({ post::set::views::Set(1), post::set::views::Increment(4), post::set::views::Multiply(3) })
                             .Exec();
    CHECK(chained.views == 15);
}

TEST_CASE_METHOD(BlogFixture, "Update: arithmetic on NULL stays NULL", "[Write]")
{
    CreateSampleBlog();

    auto const updated = user::Client(client)
                             .Update()
                             .Where(user::where::id::Equals(bob.id))
                             .Mutate(user::set::age::Increment(1))
                             .Exec();
    CHECK(!updated.age.has_value());

    auto const cleared = user::Client(client)
                             .Update()
                             .Where(user::where::id::Equals(alice.id))
                             .Mutate(user::set::age::SetNull())
                             .Exec();
    CHECK(!cleared.age.has_value());
}

TEST_CASE_METHOD(BlogFixture, "Update: invalid mutations", "[Write]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);
    auto const where = post::where::id::Equals(aliceHello.id);

    CHECK_THROWS_AS(posts.Update().Where(where).Mutate(post::set::views::Divide(0)).Exec(),
                    Refract::QueryValidationError);
    CHECK_THROWS_AS(
        posts.Update()
            .Where(where)
            .Mutate(FieldMutation { .field = "title", .kind = MutationKind::Increment, .value = SqlVariant { 1 } })
            .Exec(),
        Refract::QueryValidationError);
    CHECK_THROWS_AS(
        posts.Update()
            .Where(where)
            .Mutate(FieldMutation { .field = "title", .kind = MutationKind::SetNull, .value = SqlVariant { SqlNullValue } })
            .Exec(),
        Refract::QueryValidationError);
    CHECK_THROWS_AS(
        posts.Update()
            .Where(where)
            .Mutate(FieldMutation { .field = "subtitle", .kind = MutationKind::Set, .value = SqlVariant { "x" } })
            .Exec(),
        Refract::QueryValidationError);

    // The failed updates left the row untouched.
    CHECK(posts.FindUnique(post::where::id::Unique(aliceHello.id)).Exec() == aliceHello);
}

TEST_CASE_METHOD(BlogFixture, "Update: arithmetic overflow is rejected", "[Write]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);
    auto const where = post::where::id::Equals(aliceHello.id);
    constexpr auto maxViews = std::numeric_limits<int64_t>::max();
    constexpr auto minViews = std::numeric_limits<int64_t>::min();

    CHECK(posts.Update().Where(where).Mutate(post::set::views::Set(maxViews)).Exec().views == maxViews);
    CHECK_THROWS_AS(posts.Update().Where(where).Mutate(post::set::views::Increment(1)).Exec(),
                    Refract::QueryValidationError);
    CHECK_THROWS_AS(posts.Update().Where(where).Mutate(post::set::views::Multiply(2)).Exec(),
                    Refract::QueryValidationError);
    CHECK(posts.Update().Where(where).Mutate(post::set::views::Decrement(maxViews)).Exec().views == 0);

    CHECK(posts.Update().Where(where).Mutate(post::set::views::Set(minViews)).Exec().views == minViews);
    CHECK_THROWS_AS(posts.Update().Where(where).Mutate(post::set::views::Decrement(1)).Exec(),
                    Refract::QueryValidationError);
    CHECK_THROWS_AS(posts.Update().Where(where).Mutate(post::set::views::Divide(-1)).Exec(),
                    Refract::QueryValidationError);
    CHECK(posts.Update().Where(where).Mutate(post::set::views::Divide(2)).Exec().views == minViews / 2);

    // Results beyond a 32-bit field are rejected, even though they fit into 64 bits.
    auto const users = user::Client(client);
    auto const isAlice = user::where::id::Equals(alice.id);
    (void) users.Update().Where(isAlice).Mutate(user::set::age::Set(std::numeric_limits<int32_t>::max())).Exec();
    CHECK_THROWS_AS(users.Update().Where(isAlice).Mutate(user::set::age::Increment(1)).Exec(),
                    Refract::QueryValidationError);
    CHECK(users.FindUnique(user::where::id::Unique(alice.id)).Exec()->age == std::numeric_limits<int32_t>::max());
}

TEST_CASE("ComputeIntegralMutation: 64-bit boundaries", "[Write]")
{
    using Refract::ComputeIntegralMutation;
    constexpr auto maxSigned = std::numeric_limits<long long>::max();
    constexpr auto minSigned = std::numeric_limits<long long>::min();
    constexpr auto maxUnsigned = std::numeric_limits<unsigned long long>::max();
    constexpr auto firstUnsigned = static_cast<unsigned long long>(maxSigned) + 1;

    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { 40 }, 2) == SqlVariant { 42LL });
    CHECK(ComputeIntegralMutation(MutationKind::Multiply, SqlVariant { -3 }, 4) == SqlVariant { -12LL });
    CHECK(ComputeIntegralMutation(MutationKind::Divide, SqlVariant { 7 }, -2) == SqlVariant { -3LL });

    // Non-negative results beyond the signed range continue in unsigned arithmetic.
    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { maxSigned }, 1) == SqlVariant { firstUnsigned });
    CHECK(ComputeIntegralMutation(MutationKind::Multiply, SqlVariant { 1LL << 62 }, 2) == SqlVariant { firstUnsigned });
    CHECK(ComputeIntegralMutation(MutationKind::Decrement, SqlVariant { firstUnsigned }, 1)
          == SqlVariant { static_cast<unsigned long long>(maxSigned) });
    CHECK(ComputeIntegralMutation(MutationKind::Decrement, SqlVariant { maxUnsigned }, -1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { maxUnsigned }, 1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { maxUnsigned }, -1)
          == SqlVariant { maxUnsigned - 1 });
    CHECK(ComputeIntegralMutation(MutationKind::Multiply, SqlVariant { firstUnsigned }, 2) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Multiply, SqlVariant { firstUnsigned }, -1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Divide, SqlVariant { maxUnsigned }, 2)
          == SqlVariant { maxUnsigned / 2 });
    CHECK(ComputeIntegralMutation(MutationKind::Divide, SqlVariant { maxUnsigned }, -1) == std::nullopt);

    CHECK(ComputeIntegralMutation(MutationKind::Decrement, SqlVariant { minSigned }, 1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { minSigned }, minSigned) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Multiply, SqlVariant { minSigned }, -1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Divide, SqlVariant { minSigned }, -1) == std::nullopt);
    CHECK(ComputeIntegralMutation(MutationKind::Divide, SqlVariant { 1 }, 0) == std::nullopt);

    CHECK(ComputeIntegralMutation(MutationKind::Increment, SqlVariant { "many" }, 1) == std::nullopt);
}

TEST_CASE_METHOD(BlogFixture, "Update: no matching row", "[Write]")
{
    CreateSampleBlog();

    auto recorder = ScopedEntityEventRecorder {};
    CHECK_THROWS_AS(user::Client(client)
                        .Update()
                        .Where(user::where::email::Equals("nobody@example.com"))
                        .Mutate(user::set::name::Set("Nobody"))
                        .Exec(),
                    Refract::RecordNotFoundError);
    REQUIRE(recorder.recordsNotFound.size() == 1);
    CHECK(recorder.recordsNotFound[0].entityName == "User");
}

TEST_CASE_METHOD(BlogFixture, "Delete", "[Write]")
{
    CreateSampleBlog();

    auto const deleted = post::Client(client).Delete().Where(post::where::id::Equals(aliceHello.id)).Exec();
    CHECK(deleted == aliceHello);
    CHECK(CountRows("posts") == 2);

    // The comments of the post are deleted along.
    CHECK(CountRows("comments") == 0);

    auto const _ = ScopedSqlNullLogger {};
    CHECK_THROWS_AS(post::Client(client).Delete().Where(post::where::id::Equals(aliceHello.id)).Exec(),
                    Refract::RecordNotFoundError);
    CHECK(CountRows("posts") == 2);
}

TEST_CASE_METHOD(BlogFixture, "Delete: a where condition is required", "[Write]")
{
    CreateSampleBlog();

    CHECK_THROWS_AS(user::Client(client).Delete().Exec(), Refract::QueryValidationError);
    CHECK(CountRows("users") == 3);
}

TEST_CASE_METHOD(BlogFixture, "Upsert", "[Write]")
{
    auto const upsert = [&] {
        return user::Client(client)
            .Upsert()
            .Where(user::where::email::Equals("erin@example.com"))
            .Create(User { .id = 0, .email = "erin@example.com", .name = "Erin", .age = 20 })
            .Update({ user::set::age::Increment(1) })
            .Exec();
    };

    auto const created = upsert();
    CHECK(created.name == "Erin");
    CHECK(created.age == 20);
    CHECK(CountRows("users") == 1);

    auto const updated = upsert();
    CHECK(updated.id == created.id);
    CHECK(updated.age == 21);
    CHECK(CountRows("users") == 1);

    CHECK_THROWS_AS(user::Client(client).Upsert().Create(created).Exec(), Refract::QueryValidationError);
}

TEST_CASE_METHOD(BlogFixture, "CreateMany", "[Write]")
{
    auto const count = user::Client(client)
                           .CreateMany()
                           .Data({ User { .id = 0, .email = "a@example.com", .name = "A" },
                                   User { .id = 0, .email = "b@example.com", .name = "B", .age = 2 } })
                           .Add(User { .id = 0, .email = "c@example.com", .name = "C" })
                           .Exec();
    CHECK(count == 3);
    CHECK(CountRows("users") == 3);

    CHECK(user::Client(client).CreateMany().Exec() == 0);
}

TEST_CASE_METHOD(BlogFixture, "CreateMany: all rows or none", "[Write]")
{
    auto const _ = ScopedSqlNullLogger {};
    CHECK_THROWS_AS(user::Client(client)
                        .CreateMany()
                        .Add(User { .id = 0, .email = "a@example.com", .name = "A" })
                        .Add(User { .id = 0, .email = "a@example.com", .name = "A again" })
                        .Exec(),
                    SqlException);
    CHECK(CountRows("users") == 0);
}

TEST_CASE_METHOD(BlogFixture, "UpdateMany", "[Write]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);

    CHECK(posts.UpdateMany()
              .Where(post::where::author_id::Equals(alice.id))
              .Mutate(post::set::views::Increment(1))
              .Exec()
          == 2);
    CHECK(posts.FindUnique(post::where::id::Unique(aliceHello.id)).Exec()->views == 101);
    CHECK(posts.FindUnique(post::where::id::Unique(aliceSpam.id)).Exec()->views == 6);
    CHECK(posts.FindUnique(post::where::id::Unique(bobDraft.id)).Exec()->views == 0);

    CHECK(posts.UpdateMany()
              .Where(post::where::published::Equals(false))
              .Data({ post::set::published::Set(true), post::set::content::Set("Reviewed") })
              .Exec()
          == 2);
    CHECK(posts.Count().Where(post::where::published::Equals(true)).Exec() == 3);

    // Without mutations, the number of matching rows is reported.
    CHECK(posts.UpdateMany().Where(post::where::views::GreaterThan(5)).Exec() == 2);

    CHECK(posts.UpdateMany().Where(post::where::title::Equals("Missing")).Mutate(post::set::views::Set(1)).Exec()
          == 0);
    CHECK_THROWS_AS(posts.UpdateMany().Mutate(post::set::views::Divide(0)).Exec(), Refract::QueryValidationError);
}

TEST_CASE_METHOD(BlogFixture, "DeleteMany", "[Write]")
{
    CreateSampleBlog();

    CHECK(post::Client(client).DeleteMany().Where(post::where::published::Equals(false)).Exec() == 2);
    CHECK(IdsOf(post::Client(client).FindMany().Exec()) == std::vector { aliceHello.id });
    CHECK(post::Client(client).DeleteMany().Where(post::where::published::Equals(false)).Exec() == 0);

    // Deleting a user keeps their posts, without an author.
    CHECK(user::Client(client).DeleteMany().Where(user::where::id::Equals(alice.id)).Exec() == 1);
    auto const orphan = post::Client(client).FindUnique(post::where::id::Unique(aliceHello.id)).Exec();
    REQUIRE(orphan.has_value());
    CHECK(!orphan->author_id.has_value());

    CHECK(comment::Client(client).DeleteMany().Exec() == 2);
    CHECK(CountRows("comments") == 0);
}
