// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"

#include <string>
#include <string_view>

namespace Refract
{

/// Converts PascalCase or camelCase to snake_case, e.g. "UserId" to "user_id".
[[nodiscard]] REFRACT_API std::string ToSnakeCase(std::string_view name);

/// Converts snake_case to PascalCase, e.g. "user_id" to "UserId".
[[nodiscard]] REFRACT_API std::string ToPascalCase(std::string_view name);

[[nodiscard]] REFRACT_API std::string ToLowerAscii(std::string_view text);

/// Strips namespace and module qualifiers, e.g. "blog::User" or "super::user::Entity" to its last segment.
[[nodiscard]] REFRACT_API std::string_view LastPathSegment(std::string_view path) noexcept;

/// Name under which an entity is registered: unqualified and lowercased.
[[nodiscard]] REFRACT_API std::string NormalizeEntityName(std::string_view name);

/// The table name assumed for an entity that is not part of the current schema, e.g. "BlogPost" to "blog_posts".
[[nodiscard]] REFRACT_API std::string DefaultTableName(std::string_view entityName);

} // namespace Refract
