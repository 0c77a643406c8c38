// SPDX-License-Identifier: Apache-2.0

#include "BlogModel.hpp"

#include <Refract/Error.hpp>
#include <Refract/SqlConnection.hpp>
#include <Refract/SqlLogger.hpp>
#include <Refract/SqlStatement.hpp>

#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;
using namespace blog;

namespace
{

auto constexpr DefaultConnectionString = "DRIVER=SQLite3;Database=file::memory:"sv;

void CreateTables(SqlConnection& connection)
{
    auto stmt = SqlStatement { connection };
    stmt.ExecuteDirect("PRAGMA foreign_keys = ON");
    stmt.ExecuteDirect(R"SQL(CREATE TABLE "users" (
                                 "id" INTEGER PRIMARY KEY AUTOINCREMENT,
                                 "email" VARCHAR(100) NOT NULL UNIQUE,
                                 "name" VARCHAR(100) NOT NULL,
                                 "age" INTEGER NULL
                             ))SQL");
    stmt.ExecuteDirect(R"SQL(CREATE TABLE "posts" (
                                 "id" INTEGER PRIMARY KEY AUTOINCREMENT,
                                 "title" VARCHAR(200) NOT NULL,
                                 "content" VARCHAR(1000) NULL,
                                 "published" BOOLEAN NOT NULL,
                                 "views" BIGINT NOT NULL,
                                 "author_id" INTEGER NULL REFERENCES "users" ("id") ON DELETE SET NULL
                             ))SQL");
    stmt.ExecuteDirect(R"SQL(CREATE TABLE "comments" (
                                 "id" INTEGER PRIMARY KEY AUTOINCREMENT,
                                 "body" VARCHAR(500) NOT NULL,
                                 "post_id" INTEGER NOT NULL REFERENCES "posts" ("id") ON DELETE CASCADE
                             ))SQL");
    stmt.ExecuteDirect(R"SQL(CREATE TABLE "profiles" (
                                 "id" INTEGER PRIMARY KEY AUTOINCREMENT,
                                 "user_id" INTEGER NOT NULL UNIQUE REFERENCES "users" ("id"),
                                 "bio" VARCHAR(500) NOT NULL
                             ))SQL");
}

void Run(Refract::Client const& client)
{
    auto const users = user::Client(client);
    auto const posts = post::Client(client);

    (void) users.Create(User { .id = 0, .email = "alice@example.com", .name = "Alice", .age = 30 })
        .With(user::profile::CreateNested({ Profile { .id = 0, .user_id = 0, .bio = "Writes about databases" } }))
        .Exec();
    auto const bob = users.Create(User { .id = 0, .email = "bob@example.com", .name = "Bob" }).Exec();

    // The author is looked up by email before the post is inserted.
    (void) posts.Create(Post { .id = 0, .title = "Hello World", .published = true, .views = 0 })
        .With(post::author::Connect(user::where::email::Unique("alice@example.com")))
        .Exec();
    (void) posts.Create(Post { .id = 0, .title = "Buy cheap spam", .published = false, .views = 0 })
        .With(post::author::Connect(user::where::email::Unique("bob@example.com")))
        .Exec();

    (void) posts.UpdateMany().Where(post::where::published::Equals(true)).Mutate(post::set::views::Increment(42)).Exec();

    auto const clean = users.FindMany()
                           .Where(user::posts::None({ post::where::title::Contains("spam") }))
                           .Include(user::posts::Include().OrderBy(post::order::views(Refract::SortOrder::Desc)))
                           .Include(user::profile::Include())
                           .Exec();
    for (auto const& author: clean)
    {
        std::println("{} <{}>{}", author.name, author.email, author.profile ? ": " + author.profile->bio : "");
        for (auto const& post: author.posts.value_or(std::vector<Post> {}))
            std::println("  {} ({} views)", post.title, post.views);
    }

    auto const stats = posts.Aggregate().Count().Sum("views").Exec();
    std::println("{} posts, {} views in total", stats.count.value_or(0), stats.sum.at("views"));

    try
    {
        (void) posts.Create(Post { .id = 0, .title = "Ghost post", .published = false, .views = 0 })
            .With(post::author::Connect(user::where::email::Unique("ghost@example.com")))
            .Exec();
    }
    catch (Refract::RecordNotFoundError const& error)
    {
        std::println("Not created: {}", error.what());
    }

    // Posts outlive their author.
    auto const removed = users.Delete().Where(user::where::id::Equals(bob.id)).Exec();
    std::println("Deleted {}, {} posts without an author",
                 removed.name,
                 posts.Count().Where(post::where::author_id::IsNull()).Exec());
}

} // namespace

int main(int argc, char const* argv[])
{
    auto connectionString = std::string(DefaultConnectionString);

    for (int i = 1; i < argc; ++i)
    {
        if (argv[i] == "--trace-sql"sv)
            SqlLogger::SetLogger(SqlLogger::TraceLogger());
        else if (argv[i] == "--connection-string"sv)
        {
            if (++i >= argc)
                return EXIT_FAILURE;
            connectionString = argv[i];
        }
        else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
        {
            std::println("Usage: {} [options]", argv[0]);
            std::println("Options:");
            std::println("  --trace-sql             Enable SQL tracing");
            std::println("  --connection-string STR ODBC connection string (default: {})", DefaultConnectionString);
            std::println("  --help, -h              Display this information");
            return EXIT_SUCCESS;
        }
        else
        {
            std::println(stderr, "Unknown option: {}", argv[i]);
            return EXIT_FAILURE;
        }
    }

    SqlConnection::SetDefaultConnectionString(SqlConnectionString { connectionString });

    try
    {
        auto connection = SqlConnection {};
        if (!connection.IsAlive())
        {
            std::println(stderr, "Cannot connect to {}", connectionString);
            return EXIT_FAILURE;
        }

        CreateTables(connection);

        auto registry = Refract::EntityRegistry {};
        blog::Register(registry);
        Run(Refract::Client { connection, registry });
    }
    catch (Refract::RefractError const& error)
    {
        std::println(stderr, "{}", error.what());
        return EXIT_FAILURE;
    }
    catch (SqlException const& error)
    {
        std::println(stderr, "{}", error.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
