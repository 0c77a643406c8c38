// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/Entity.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

/// Prints the C++ header of a compiled schema.
///
/// Per entity the header holds a struct with its fields and relation slots, its metadata and
/// record conversion, and an entity namespace with the where, set and order surfaces, one
/// namespace per relation, and the client accessor. A Register() function closes the header.
class REFRACT_API CxxEntityPrinter
{
  public:
    /// @param entities The compiled and resolved entities, as returned by CompileSchema().
    explicit CxxEntityPrinter(std::vector<EntityInfo> entities);

    /// Renders the header, wrapping everything but the includes into the given namespace, if any.
    [[nodiscard]] std::string str(std::string_view modelNamespace) const;

  private:
    void PrintStruct(EntityInfo const& entity);
    void PrintMetadata(EntityInfo const& entity);
    void PrintRecordConversion(EntityInfo const& entity);
    void PrintEquality(EntityInfo const& entity);
    void PrintWhereNamespace(EntityInfo const& entity);
    void PrintSetNamespace(EntityInfo const& entity);
    void PrintOrderNamespace(EntityInfo const& entity);
    void PrintRelationNamespace(EntityInfo const& entity, RelationInfo const& relation);
    void PrintRegisterFunction();

    /// The struct name of the relation's target, or an empty string if the target is not part of the schema.
    [[nodiscard]] std::string TargetTypeName(RelationInfo const& relation) const;

    std::vector<EntityInfo> m_entities;
    std::stringstream m_definitions;
};

/// The C++ type of a field in the generated struct, e.g. "std::optional<int32_t>".
[[nodiscard]] REFRACT_API std::string CxxTypeOf(FieldInfo const& field);

} // namespace Refract
