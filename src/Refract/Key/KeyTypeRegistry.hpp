// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/Entity.hpp"
#include "EntityKey.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Refract
{

/// Answers which type an entity expects for one of its key fields.
///
/// Entity names are matched unqualified and case-insensitively.
class REFRACT_API KeyTypeRegistry
{
  public:
    void Register(std::string_view entityName, std::string_view fieldName, FieldType type);

    /// Registers the primary key and all foreign key fields of the entity.
    void Register(EntityInfo const& entity);

    [[nodiscard]] std::optional<FieldType> FieldTypeOf(std::string_view entityName,
                                                       std::string_view fieldName) const;

    /// Converts the key into the type the entity's field expects.
    ///
    /// Falls back to the key's own type if the entity or field is unknown.
    ///
    /// @throws KeyConversionError if the key cannot be represented in the expected type.
    [[nodiscard]] SqlVariant ConvertKey(EntityKey const& key,
                                        std::string_view entityName,
                                        std::string_view fieldName) const;

  private:
    std::map<std::string, std::map<std::string, FieldType, std::less<>>, std::less<>> m_types;
};

} // namespace Refract
