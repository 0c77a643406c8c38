// SPDX-License-Identifier: Apache-2.0

#include "BlogSchema.hpp"

namespace blog
{

using namespace Refract;

SchemaDeclaration BlogSchema()
{
    auto user = EntityDeclaration {
        .name = "User",
        .tableName = "users",
        .fields = {
            FieldDeclaration { .name = "Id", .type = "i32", .primaryKey = true },
            FieldDeclaration { .name = "Email", .type = "String", .unique = true },
            FieldDeclaration { .name = "Name", .type = "String" },
            FieldDeclaration { .name = "Age", .type = "Option<i32>" },
        },
        .relations = {
            RelationDeclaration { .name = "posts",
                                  .kind = "has_many",
                                  .target = "super::post::Entity",
                                  .from = "Column::Id",
                                  .to = "super::post::Column::AuthorId" },
            RelationDeclaration { .name = "profile",
                                  .kind = "has_one",
                                  .target = "super::profile::Entity",
                                  .from = "Column::Id",
                                  .to = "super::profile::Column::UserId" },
        },
    };

    auto post = EntityDeclaration {
        .name = "Post",
        .tableName = "posts",
        .fields = {
            FieldDeclaration { .name = "Id", .type = "i32", .primaryKey = true },
            FieldDeclaration { .name = "Title", .type = "String" },
            FieldDeclaration { .name = "Content", .type = "Option<String>" },
            FieldDeclaration { .name = "Published", .type = "bool" },
            FieldDeclaration { .name = "Views", .type = "i64" },
            FieldDeclaration { .name = "AuthorId", .type = "Option<i32>" },
        },
        .relations = {
            RelationDeclaration { .name = "author",
                                  .kind = "belongs_to",
                                  .target = "super::user::Entity",
                                  .from = "Column::AuthorId",
                                  .to = "super::user::Column::Id" },
            RelationDeclaration { .name = "comments",
                                  .kind = "has_many",
                                  .target = "super::comment::Entity",
                                  .from = "Column::Id",
                                  .to = "super::comment::Column::PostId" },
        },
    };

    auto comment = EntityDeclaration {
        .name = "Comment",
        .tableName = "comments",
        .fields = {
            FieldDeclaration { .name = "Id", .type = "i32", .primaryKey = true },
            FieldDeclaration { .name = "Body", .type = "String" },
            FieldDeclaration { .name = "PostId", .type = "i32" },
        },
        .relations = {
            RelationDeclaration { .name = "post",
                                  .kind = "belongs_to",
                                  .target = "super::post::Entity",
                                  .from = "Column::PostId",
                                  .to = "super::post::Column::Id" },
        },
    };

    auto profile = EntityDeclaration {
        .name = "Profile",
        .tableName = "profiles",
        .fields = {
            FieldDeclaration { .name = "Id", .type = "i32", .primaryKey = true },
            FieldDeclaration { .name = "UserId", .type = "i32", .unique = true },
            FieldDeclaration { .name = "Bio", .type = "String" },
        },
        .relations = {
            RelationDeclaration { .name = "user",
                                  .kind = "belongs_to",
                                  .target = "super::user::Entity",
                                  .from = "Column::UserId",
                                  .to = "super::user::Column::Id" },
        },
    };

    return SchemaDeclaration {
        .name = "blog",
        .entities = { std::move(user), std::move(post), std::move(comment), std::move(profile) },
    };
}

} // namespace blog
