// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace Refract
{

enum class MutationKind : uint8_t
{
    Set,
    SetNull,
    Increment,
    Decrement,
    Multiply,
    Divide,
};

/// One change to a field, applied by update and update-many in the order given.
struct FieldMutation
{
    std::string field;
    MutationKind kind = MutationKind::Set;
    SqlVariant value;
};

/// Applies an arithmetic mutation (increment to divide) to an integer value with the given operand.
///
/// Computes in signed 64-bit arithmetic, falling back to unsigned for non-negative results beyond it.
/// Returns std::nullopt if the result fits into neither, on division by zero, or for a non-integral value.
[[nodiscard]] REFRACT_API std::optional<SqlVariant> ComputeIntegralMutation(MutationKind kind,
                                                                            SqlVariant const& current,
                                                                            long long operand);

} // namespace Refract
