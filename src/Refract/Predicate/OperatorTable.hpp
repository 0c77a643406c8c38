// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/Entity.hpp"
#include "Mutation.hpp"
#include "Predicate.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace Refract
{

// The one table that decides which operators and mutators a field gets.
// Both the code generator and the predicate compiler consult it.

/// Operators available on every field of the given type class, regardless of nullability.
[[nodiscard]] REFRACT_API std::span<FieldOperator const> OperatorsOf(TypeClass typeClass) noexcept;

/// Mutators available on every field of the given type class, regardless of nullability.
[[nodiscard]] REFRACT_API std::span<MutationKind const> MutationsOf(TypeClass typeClass) noexcept;

/// All operators of the field, including IsNull and IsNotNull for nullable fields.
[[nodiscard]] REFRACT_API std::vector<FieldOperator> AllowedOperators(FieldInfo const& field);

/// All mutators of the field, including SetNull for nullable fields.
[[nodiscard]] REFRACT_API std::vector<MutationKind> AllowedMutations(FieldInfo const& field);

[[nodiscard]] REFRACT_API bool IsOperatorAllowed(FieldInfo const& field, FieldOperator op) noexcept;

[[nodiscard]] REFRACT_API bool IsMutationAllowed(FieldInfo const& field, MutationKind kind) noexcept;

/// Tests if the field supports a case-insensitive query mode.
[[nodiscard]] REFRACT_API bool IsQueryModeAllowed(FieldInfo const& field) noexcept;

/// Name of the generated function for the operator, e.g. "Equals" or "JsonArrayContains".
[[nodiscard]] REFRACT_API std::string_view NameOf(FieldOperator op) noexcept;

[[nodiscard]] REFRACT_API std::string_view NameOf(MutationKind kind) noexcept;

} // namespace Refract
