// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Refract
{

/// Declares one field of an entity.
struct FieldDeclaration
{
    std::string name; // PascalCase or snake_case, normalized to snake_case
    std::string type; // e.g. "i32", "String", "Option<DateTime>", "std::optional<int64_t>"
    bool primaryKey = false;
    bool unique = false;

    /// Marks the field nullable in addition to an Option<> or std::optional<> type wrapper.
    bool nullable = false;

    std::optional<std::string> columnName;
};

/// Declares one relation of an entity.
///
/// References are path-like, e.g. target "super::post::Entity", from "Column::Id" and to "super::post::Column::UserId".
struct RelationDeclaration
{
    std::string name;
    std::string kind; // "has_many", "belongs_to" or "has_one"
    std::string target;
    std::string from;
    std::string to;
};

struct EntityDeclaration
{
    std::string name;
    std::optional<std::string> tableName;
    std::vector<FieldDeclaration> fields;
    std::vector<RelationDeclaration> relations;
};

/// A set of entity declarations that are generated together.
struct SchemaDeclaration
{
    std::string name;
    std::vector<EntityDeclaration> entities;
};

} // namespace Refract
