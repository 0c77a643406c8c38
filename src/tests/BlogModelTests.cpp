// SPDX-License-Identifier: Apache-2.0

#include "BlogFixture.hpp"

#include <Refract/Error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace blog;

TEST_CASE("BlogModel: metadata", "[BlogModel]")
{
    auto const& info = User::Metadata();
    CHECK(info.name == "User");
    CHECK(info.tableName == "users");
    CHECK(info.PrimaryKey().name == "id");
    REQUIRE(info.FindField("email") != nullptr);
    CHECK(info.FindField("email")->unique);
    CHECK(info.FindField("age")->nullable);

    auto const& posts = info.RequireRelation("posts");
    CHECK(posts.kind == Refract::RelationKind::HasMany);
    CHECK(posts.foreignKeyColumn == "author_id");
    CHECK(Post::Metadata().RequireRelation("author").kind == Refract::RelationKind::BelongsTo);
}

TEST_CASE("BlogModel: record conversion", "[BlogModel]")
{
    auto const post = Post {
        .id = 4, .title = "Notes", .content = std::nullopt, .published = true, .views = 12, .author_id = 2
    };

    auto const record = post.ToRecord();
    CHECK(record.Get("title") == SqlVariant { "Notes" });
    CHECK(record.GetOrNull("content").IsNull());
    CHECK(record.Get("views").TryGetIntegral<int64_t>() == 12);
    CHECK(Post::FromRecord(record) == post);

    // Database assigned keys are left out while unset.
    CHECK(!User { .id = 0, .email = "x@example.com", .name = "X" }.ToRecord().Contains("id"));
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: registration", "[BlogModel]")
{
    CHECK(&client.Entity<User>().Metadata() == &registry.Entity("User"));
    CHECK_NOTHROW((void) registry.Fetcher("Comment"));
    CHECK_THROWS_AS((void) registry.Fetcher("Tag"), Refract::FetcherMissingError);
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: included single relations compare by value", "[BlogModel]")
{
    CreateSampleBlog();

    auto const read = [&] {
        return post::Client(client)
            .FindUnique(post::where::id::Unique(aliceHello.id))
            .Include(post::author::Include())
            .Exec();
    };
    auto const first = read();
    auto const second = read();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->author != nullptr);

    // Two reads of the same row hold distinct copies of the same author.
    CHECK(first->author != second->author);
    CHECK(*first == *second);

    auto renamed = *second;
    renamed.author = std::make_shared<User>(*second->author);
    renamed.author->name = "Alicia";
    CHECK(*first != renamed);

    renamed.author = nullptr;
    CHECK(*first != renamed);
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: relation quantifiers", "[BlogModel]")
{
    CreateSampleBlog();

    auto const users = user::Client(client);
    auto const withSpam = post::where::title::Contains("spam");

    CHECK(IdsOf(users.FindMany().Where(user::posts::Some({ withSpam })).Exec()) == std::vector { alice.id });
    CHECK(IdsOf(users.FindMany().Where(user::posts::None({ withSpam })).OrderBy(user::order::id()).Exec())
          == std::vector { bob.id, carol.id });
    CHECK(IdsOf(users.FindMany()
                    .Where(user::posts::Every({ post::where::published::Equals(false) }))
                    .OrderBy(user::order::id())
                    .Exec())
          == std::vector { bob.id, carol.id });

    // Without predicates, Some asks for any related row at all.
    CHECK(IdsOf(users.FindMany().Where(user::posts::Some({})).OrderBy(user::order::id()).Exec())
          == std::vector { alice.id, bob.id });
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: quantifiers over zero related rows", "[BlogModel]")
{
    CreateSampleBlog();

    auto const users = user::Client(client);
    auto const isCarol = user::where::id::Equals(carol.id);
    auto const anything = post::where::views::GreaterOrEqual(0);

    // Carol has no posts: Every and None hold vacuously, Some does not.
    CHECK(users.Count().Where(isCarol, user::posts::Every({ anything })).Exec() == 1);
    CHECK(users.Count().Where(isCarol, user::posts::None({ anything })).Exec() == 1);
    CHECK(users.Count().Where(isCarol, user::posts::Some({ anything })).Exec() == 0);
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: nested relation filters", "[BlogModel]")
{
    CreateSampleBlog();

    // Users with a post that has a comment starting with "Great".
    auto const users = user::Client(client)
                           .FindMany()
                           .Where(user::posts::Some({ post::comments::Some({ comment::where::body::StartsWith("Great") }) }))
                           .Exec();
    CHECK(IdsOf(users) == std::vector { alice.id });

    // Comments whose post is written by Alice.
    CHECK(comment::Client(client)
              .Count()
              .Where(comment::post::Some({ post::author::Some({ user::where::name::Equals("Alice") }) }))
              .Exec()
          == 2);

    // A post without an author relates to no user.
    (void) CreatePost("Anonymous", std::nullopt);
    CHECK(post::Client(client).Count().Where(post::author::Some({})).Exec() == 3);
    CHECK(post::Client(client).Count().Where(post::author::None({})).Exec() == 1);
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: authors without spam posts, with their posts", "[BlogModel]")
{
    CreateSampleBlog();

    auto const clean = user::Client(client)
                           .FindMany()
                           .Where(user::posts::None({ post::where::title::Contains("spam") }),
                                  user::posts::Some({ post::where::published::Equals(false) }))
                           .Include(user::posts::Include())
                           .Exec();

    REQUIRE(clean.size() == 1);
    CHECK(clean[0].name == "Bob");
    REQUIRE(clean[0].posts.has_value());
    CHECK(IdsOf(*clean[0].posts) == std::vector { bobDraft.id });
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: a new spam post excludes its author", "[BlogModel]")
{
    auto const dave = CreateUser("dave@example.com", "Dave");
    (void) CreatePost("Tuning indexes", dave.id);
    (void) CreatePost("Reading plans", dave.id);

    auto const query = [&] {
        return IdsOf(user::Client(client).FindMany().Where(user::posts::None({ post::where::title::Contains("spam") })).Exec());
    };

    CHECK(query() == std::vector { dave.id });

    (void) CreatePost("More spam", dave.id);
    CHECK(query().empty());
}

TEST_CASE_METHOD(BlogFixture, "BlogModel: predicates on undeclared relations", "[BlogModel]")
{
    CreateSampleBlog();

    auto const predicate = Refract::RelationPredicate {
        .relation = "followers", .quantifier = Refract::RelationQuantifier::Some, .predicates = {}
    };
    CHECK_THROWS_AS(user::Client(client).FindMany().Where(Refract::Predicate { predicate }).Exec(),
                    Refract::RelationNotFoundError);
}
