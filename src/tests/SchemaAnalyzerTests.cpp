// SPDX-License-Identifier: Apache-2.0

#include "../examples/blog/BlogSchema.hpp"
#include "Utils.hpp"

#include <Refract/Error.hpp>
#include <Refract/Schema/EntityCatalog.hpp>
#include <Refract/Schema/NameConversion.hpp>
#include <Refract/Schema/SchemaAnalyzer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace Refract;

namespace
{

EntityDeclaration TagDeclaration()
{
    return EntityDeclaration {
        .name = "Tag",
        .tableName = "tags",
        .fields = {
            FieldDeclaration { .name = "Id", .type = "i64", .primaryKey = true },
            FieldDeclaration { .name = "Label", .type = "String", .unique = true },
            FieldDeclaration { .name = "Color", .type = "Option<String>", .columnName = "colour" },
            FieldDeclaration { .name = "ParentId", .type = "i64", .nullable = true },
        },
        .relations = {
            RelationDeclaration { .name = "parent",
                                  .kind = "belongs_to",
                                  .target = "Entity",
                                  .from = "Column::ParentId",
                                  .to = "Column::Id" },
        },
    };
}

} // namespace

TEST_CASE("NameConversion", "[Schema]")
{
    CHECK(ToSnakeCase("UserId") == "user_id");
    CHECK(ToSnakeCase("userId") == "user_id");
    CHECK(ToSnakeCase("UserID") == "user_id");
    CHECK(ToSnakeCase("HTTPServer") == "http_server");
    CHECK(ToSnakeCase("already_snake") == "already_snake");

    CHECK(ToPascalCase("user_id") == "UserId");
    CHECK(ToPascalCase("posts") == "Posts");

    CHECK(LastPathSegment("super::post::Entity") == "Entity");
    CHECK(LastPathSegment("User") == "User");
    CHECK(NormalizeEntityName("blog::User") == "user");
    CHECK(DefaultTableName("BlogPost") == "blog_posts");
    CHECK(DefaultTableName("external::Tag") == "tags");
}

TEST_CASE("SchemaAnalyzer.ParseTypeName", "[Schema]")
{
    auto const i32 = SchemaAnalyzer::ParseTypeName("i32");
    CHECK(i32.type == FieldType::Int32);
    CHECK(!i32.nullable);

    auto const optionalText = SchemaAnalyzer::ParseTypeName("Option<String>");
    CHECK(optionalText.type == FieldType::String);
    CHECK(optionalText.nullable);
    CHECK(optionalText.typeName == "String");

    auto const stdOptional = SchemaAnalyzer::ParseTypeName("std::optional<int64_t>");
    CHECK(stdOptional.type == FieldType::Int64);
    CHECK(stdOptional.nullable);

    CHECK(SchemaAnalyzer::ParseTypeName("uuid::Uuid").type == FieldType::Uuid);
    CHECK(SchemaAnalyzer::ParseTypeName("serde_json::Value").type == FieldType::Json);
    CHECK(SchemaAnalyzer::ParseTypeName("NaiveDateTime").type == FieldType::DateTime);

    auto const unknown = SchemaAnalyzer::ParseTypeName("Vec<u8>");
    CHECK(unknown.type == FieldType::Opaque);
    CHECK(unknown.typeName == "Vec<u8>");
}

TEST_CASE("SchemaAnalyzer: reference paths", "[Schema]")
{
    CHECK(SchemaAnalyzer::TargetEntityName("super::post::Entity") == "post");
    CHECK(SchemaAnalyzer::TargetEntityName("Entity") == "Entity");
    CHECK(SchemaAnalyzer::TargetEntityName("blog::Post") == "Post");
    CHECK(SchemaAnalyzer::ColumnReferenceToFieldName("super::post::Column::AuthorId") == "author_id");
    CHECK(SchemaAnalyzer::ColumnReferenceToFieldName("Column::Id") == "id");
}

TEST_CASE("SchemaAnalyzer.Analyze: fields", "[Schema]")
{
    auto const tag = SchemaAnalyzer::Analyze(TagDeclaration());

    CHECK(tag.name == "Tag");
    CHECK(tag.tableName == "tags");
    REQUIRE(tag.fields.size() == 4);

    auto const& id = tag.PrimaryKey();
    CHECK(id.name == "id");
    CHECK(id.type == FieldType::Int64);
    CHECK(id.unique);

    auto const* label = tag.FindField("label");
    REQUIRE(label != nullptr);
    CHECK(label->unique);
    CHECK(!label->nullable);

    auto const* color = tag.FindField("color");
    REQUIRE(color != nullptr);
    CHECK(color->columnName == "colour");
    CHECK(color->nullable);
    CHECK(tag.FindFieldByColumn("colour") == color);

    auto const* parentId = tag.FindField("parent_id");
    REQUIRE(parentId != nullptr);
    CHECK(parentId->nullable);
}

TEST_CASE("SchemaAnalyzer.Analyze: belongs_to records the foreign key", "[Schema]")
{
    auto const tag = SchemaAnalyzer::Analyze(TagDeclaration());

    auto const* parent = tag.FindRelation("parent");
    REQUIRE(parent != nullptr);
    CHECK(parent->kind == RelationKind::BelongsTo);
    CHECK(parent->foreignKeyField == "parent_id");
    CHECK(parent->referencedField == "id");
    CHECK(parent->foreignKeyType == FieldType::Int64);
    CHECK(parent->foreignKeyNullable);

    REQUIRE(tag.foreignKeys.size() == 1);
    CHECK(tag.foreignKeys[0].fieldName == "parent_id");
    CHECK(tag.foreignKeys[0].type == FieldType::Int64);

    CHECK_THROWS_AS(tag.RequireRelation("children"), RelationNotFoundError);
    CHECK_THROWS_AS(tag.RequireField("missing"), QueryValidationError);
}

TEST_CASE("SchemaAnalyzer.Analyze: has_many leaves the foreign key type to the resolver", "[Schema]")
{
    auto const user = SchemaAnalyzer::Analyze(blog::BlogSchema().entities.at(0));

    auto const* posts = user.FindRelation("posts");
    REQUIRE(posts != nullptr);
    CHECK(posts->kind == RelationKind::HasMany);
    CHECK(posts->targetEntity == "post");
    CHECK(posts->foreignKeyField == "author_id");
    CHECK(posts->referencedField == "id");
    CHECK(!posts->foreignKeyType.has_value());
    CHECK(posts->targetTable.empty());
    CHECK(user.foreignKeys.empty());
}

TEST_CASE("SchemaAnalyzer.Analyze: fails iff the table name or the primary key is missing", "[Schema]")
{
    for (bool const withTable: { false, true })
    {
        for (bool const withPrimaryKey: { false, true })
        {
            INFO("table: " << withTable << ", primary key: " << withPrimaryKey);

            auto declaration = TagDeclaration();
            declaration.relations.clear();
            if (!withTable)
                declaration.tableName.reset();
            declaration.fields[0].primaryKey = withPrimaryKey;

            if (withTable && withPrimaryKey)
                CHECK_NOTHROW(SchemaAnalyzer::Analyze(declaration));
            else
                CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
        }
    }
}

TEST_CASE("SchemaAnalyzer.Analyze: malformed declarations", "[Schema]")
{
    SECTION("empty table name")
    {
        auto declaration = TagDeclaration();
        declaration.tableName = "";
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }

    SECTION("two primary keys")
    {
        auto declaration = TagDeclaration();
        declaration.fields[1].primaryKey = true;
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }

    SECTION("nullable primary key")
    {
        auto declaration = TagDeclaration();
        declaration.fields[0].type = "Option<i64>";
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }

    SECTION("duplicate field after snake_case conversion")
    {
        auto declaration = TagDeclaration();
        declaration.fields.push_back(FieldDeclaration { .name = "label", .type = "String" });
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }

    SECTION("unknown relation kind")
    {
        auto declaration = TagDeclaration();
        declaration.relations[0].kind = "many_to_many";
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }

    SECTION("relation without foreign key")
    {
        auto declaration = TagDeclaration();
        declaration.relations[0].from.clear();
        CHECK_THROWS_AS(SchemaAnalyzer::Analyze(declaration), SchemaError);
    }
}

TEST_CASE("SchemaError names the entity", "[Schema]")
{
    auto declaration = TagDeclaration();
    declaration.tableName.reset();

    try
    {
        (void) SchemaAnalyzer::Analyze(declaration);
        FAIL("expected a SchemaError");
    }
    catch (SchemaError const& error)
    {
        CHECK(error.EntityName() == "Tag");
        CHECK(std::string_view(error.what()).find("missing table name") != std::string_view::npos);
    }
}

TEST_CASE("EntityCatalog: lookup by name", "[Schema]")
{
    auto catalog = EntityCatalog {};
    for (auto& entity: CompileSchema(blog::BlogSchema()))
        (void) catalog.Add(std::move(entity));

    CHECK(catalog.Size() == 4);
    REQUIRE(catalog.Find("User") != nullptr);
    CHECK(catalog.Find("user") == catalog.Find("User"));
    CHECK(catalog.Find("blog::User") == catalog.Find("User"));
    CHECK(catalog.Find("Tag") == nullptr);
    CHECK(catalog.Require("post").tableName == "posts");
    CHECK_THROWS_AS(catalog.Require("Tag"), QueryValidationError);

    // Adding an entity registers its key types.
    CHECK(catalog.KeyTypes().FieldTypeOf("Post", "id") == FieldType::Int32);
    CHECK(catalog.KeyTypes().FieldTypeOf("Post", "author_id") == FieldType::Int32);
    CHECK(catalog.KeyTypes().FieldTypeOf("Comment", "post_id") == FieldType::Int32);
}
