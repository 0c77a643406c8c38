// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "Entity.hpp"
#include "SchemaDeclaration.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

/// Result of mapping a declared type name onto a field type.
struct TypeDescriptor
{
    FieldType type = FieldType::Opaque;
    bool nullable = false;
    std::string typeName; // The declared name without nullable wrappers
};

/// First pass of the schema compilation: turns entity declarations into entity metadata.
///
/// The analyzer looks at one declaration at a time. Table names of relation targets and
/// foreign key types living on other entities are left for the RelationResolver.
class REFRACT_API SchemaAnalyzer
{
  public:
    /// Maps a declared type name, e.g. "Option<i32>" or "std::optional<std::string>", onto a field type.
    ///
    /// Unknown names map to FieldType::Opaque.
    [[nodiscard]] static TypeDescriptor ParseTypeName(std::string_view typeName);

    /// Extracts the entity name a relation target refers to, e.g. "super::post::Entity" yields "post".
    [[nodiscard]] static std::string_view TargetEntityName(std::string_view targetPath) noexcept;

    /// Extracts the snake_case field name of a column reference, e.g. "super::post::Column::AuthorId" yields "author_id".
    [[nodiscard]] static std::string ColumnReferenceToFieldName(std::string_view columnReference);

    /// Builds the metadata of one entity.
    ///
    /// @throws SchemaError if the table name or the primary key is missing, or the declaration is malformed.
    [[nodiscard]] static EntityInfo Analyze(EntityDeclaration const& declaration);

  private:
    static FieldInfo AnalyzeField(EntityDeclaration const& entity, FieldDeclaration const& field);
    static RelationInfo AnalyzeRelation(EntityDeclaration const& entity,
                                        EntityInfo const& info,
                                        RelationDeclaration const& relation);
};

/// Runs both passes of the schema compilation over a whole schema.
///
/// @throws SchemaError on the first entity that cannot be compiled.
[[nodiscard]] REFRACT_API std::vector<EntityInfo> CompileSchema(SchemaDeclaration const& schema);

} // namespace Refract
