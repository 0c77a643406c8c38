// SPDX-License-Identifier: Apache-2.0

#include "BlogFixture.hpp"

#include <Refract/Error.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace blog;
using Refract::HavingOperator;
using Refract::SortOrder;

TEST_CASE_METHOD(BlogFixture, "Aggregate: all functions", "[Aggregate]")
{
    CreateSampleBlog();

    auto const result =
        post::Client(client).Aggregate().Count().Sum("views").Avg("views").Min("views").Max("title").Exec();

    CHECK(result.count == 3);
    CHECK(result.sum.at("views").TryGetIntegral<int64_t>() == 105);
    REQUIRE(result.avg.at("views").TryGetDouble().has_value());
    CHECK_THAT(*result.avg.at("views").TryGetDouble(), Catch::Matchers::WithinAbs(35.0, 1e-9));
    CHECK(result.min.at("views").TryGetIntegral<int64_t>() == 0);
    CHECK(result.max.at("title").TryGetStringView() == "Hello World");
}

TEST_CASE_METHOD(BlogFixture, "Aggregate: filtered rows", "[Aggregate]")
{
    CreateSampleBlog();

    auto const result = user::Client(client)
                            .Aggregate()
                            .Count()
                            .Avg("age")
                            .Min("age")
                            .Where(user::where::email::EndsWith("@example.com"))
                            .Exec();

    // Count includes rows where the field is NULL, the other functions skip them.
    CHECK(result.count == 3);
    CHECK_THAT(result.avg.at("age").TryGetDouble().value_or(0.0), Catch::Matchers::WithinAbs(27.5, 1e-9));
    CHECK(result.min.at("age").TryGetIntegral<int32_t>() == 25);

    // Only the requested functions are reported.
    CHECK(result.sum.empty());
    CHECK(result.max.empty());
}

TEST_CASE_METHOD(BlogFixture, "Aggregate: zero rows", "[Aggregate]")
{
    auto const result = post::Client(client).Aggregate().Count().Sum("views").Avg("views").Max("views").Exec();

    CHECK(result.count == 0);
    CHECK(result.sum.at("views").IsNull());
    CHECK(result.avg.at("views").IsNull());
    CHECK(result.max.at("views").IsNull());
}

TEST_CASE_METHOD(BlogFixture, "Aggregate: invalid requests", "[Aggregate]")
{
    CreateSampleBlog();

    CHECK_THROWS_AS(post::Client(client).Aggregate().Exec(), Refract::QueryValidationError);
    CHECK_THROWS_AS(post::Client(client).Aggregate().Sum("title").Exec(), Refract::QueryValidationError);
    CHECK_THROWS_AS(post::Client(client).Aggregate().Avg("published").Exec(), Refract::QueryValidationError);
    CHECK_THROWS_AS(post::Client(client).Aggregate().Max("rating").Exec(), Refract::QueryValidationError);
}

TEST_CASE_METHOD(BlogFixture, "GroupBy", "[Aggregate]")
{
    CreateSampleBlog();

    auto const groups =
        post::Client(client).GroupBy().By({ "author_id" }).Count().Sum("views").OrderBy("author_id").Exec();

    REQUIRE(groups.size() == 2);
    CHECK(groups[0].group.Get("author_id").TryGetIntegral<int32_t>() == alice.id);
    CHECK(groups[0].aggregates.count == 2);
    CHECK(groups[0].aggregates.sum.at("views").TryGetIntegral<int64_t>() == 105);
    CHECK(groups[1].group.Get("author_id").TryGetIntegral<int32_t>() == bob.id);
    CHECK(groups[1].aggregates.count == 1);
    CHECK(groups[1].aggregates.sum.at("views").TryGetIntegral<int64_t>() == 0);

    // Only the grouped fields are reported.
    CHECK(!groups[0].group.Contains("title"));
}

TEST_CASE_METHOD(BlogFixture, "GroupBy: having, ordering and pagination", "[Aggregate]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);

    auto const prolific = posts.GroupBy().By({ "author_id" }).Count().Having(HavingOperator::GreaterThan, 1).Exec();
    REQUIRE(prolific.size() == 1);
    CHECK(prolific[0].group.Get("author_id").TryGetIntegral<int32_t>() == alice.id);

    auto const single = posts.GroupBy().By({ "author_id" }).Having(HavingOperator::Equals, 1).Exec();
    REQUIRE(single.size() == 1);
    CHECK(single[0].group.Get("author_id").TryGetIntegral<int32_t>() == bob.id);
    CHECK(!single[0].aggregates.count.has_value());

    CHECK(posts.GroupBy().By({ "author_id" }).Having(HavingOperator::LessThan, 1).Exec().empty());

    auto const byCount = posts.GroupBy().By({ "published" }).Count().OrderByCount(SortOrder::Desc).Take(1).Exec();
    REQUIRE(byCount.size() == 1);
    CHECK(byCount[0].group.Get("published").TryGetBool() == false);
    CHECK(byCount[0].aggregates.count == 2);

    auto const rest =
        posts.GroupBy().By({ "published" }).Count().OrderBy("published", SortOrder::Asc).Skip(1).Exec();
    REQUIRE(rest.size() == 1);
    CHECK(rest[0].group.Get("published").TryGetBool() == true);
}

TEST_CASE_METHOD(BlogFixture, "GroupBy: invalid requests", "[Aggregate]")
{
    CreateSampleBlog();

    auto const posts = post::Client(client);

    CHECK_THROWS_AS(posts.GroupBy().Count().Exec(), Refract::QueryValidationError);
    CHECK_THROWS_AS(posts.GroupBy().By({ "author_id" }).OrderBy("views").Exec(), Refract::QueryValidationError);
    CHECK_THROWS_AS(posts.GroupBy().By({ "editor_id" }).Exec(), Refract::QueryValidationError);
}
