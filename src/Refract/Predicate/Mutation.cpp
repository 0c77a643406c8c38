// SPDX-License-Identifier: Apache-2.0

#include "Mutation.hpp"

#include <limits>

namespace Refract
{

namespace
{

    /// Integer arithmetic, or std::nullopt if the result does not fit into 64 bits.
    std::optional<long long> CheckedCompute(MutationKind kind, long long lhs, long long rhs) noexcept
    {
        constexpr auto max = std::numeric_limits<long long>::max();
        constexpr auto min = std::numeric_limits<long long>::min();

        switch (kind)
        {
            case MutationKind::Increment:
                if ((rhs > 0 && lhs > max - rhs) || (rhs < 0 && lhs < min - rhs))
                    return std::nullopt;
                return lhs + rhs;
            case MutationKind::Decrement:
                if ((rhs < 0 && lhs > max + rhs) || (rhs > 0 && lhs < min + rhs))
                    return std::nullopt;
                return lhs - rhs;
            case MutationKind::Multiply:
                if (lhs > 0 ? (rhs > 0 ? lhs > max / rhs : rhs < min / lhs)
                            : (rhs > 0 ? lhs < min / rhs : lhs != 0 && rhs < max / lhs))
                    return std::nullopt;
                return lhs * rhs;
            case MutationKind::Divide:
                if (rhs == 0 || (lhs == min && rhs == -1))
                    return std::nullopt;
                return lhs / rhs;
            case MutationKind::Set:
            case MutationKind::SetNull:
                break;
        }
        return rhs;
    }

    /// Unsigned integer arithmetic, or std::nullopt if the result is negative or does not fit into 64 bits.
    std::optional<unsigned long long> CheckedCompute(MutationKind kind, unsigned long long lhs, long long rhs) noexcept
    {
        constexpr auto max = std::numeric_limits<unsigned long long>::max();
        auto const magnitude = rhs < 0 ? 0ULL - static_cast<unsigned long long>(rhs) : static_cast<unsigned long long>(rhs);

        auto const add = [&](bool subtract) -> std::optional<unsigned long long> {
            if (subtract)
                return magnitude > lhs ? std::nullopt : std::optional { lhs - magnitude };
            return magnitude > max - lhs ? std::nullopt : std::optional { lhs + magnitude };
        };

        switch (kind)
        {
            case MutationKind::Increment:
                return add(rhs < 0);
            case MutationKind::Decrement:
                return add(rhs > 0);
            case MutationKind::Multiply:
                if (rhs < 0 && lhs != 0)
                    return std::nullopt;
                if (rhs != 0 && lhs > max / magnitude)
                    return std::nullopt;
                return lhs * magnitude;
            case MutationKind::Divide:
                if (rhs <= 0)
                    return std::nullopt;
                return lhs / magnitude;
            case MutationKind::Set:
            case MutationKind::SetNull:
                break;
        }
        return std::nullopt;
    }

} // namespace

std::optional<SqlVariant> ComputeIntegralMutation(MutationKind kind, SqlVariant const& current, long long operand)
{
    if (auto const lhs = current.TryGetIntegral<long long>(); lhs)
        if (auto const result = CheckedCompute(kind, *lhs, operand); result)
            return SqlVariant { *result };

    // Results beyond the signed range may still fit into an unsigned field.
    auto const lhs = current.TryGetIntegral<unsigned long long>();
    if (!lhs)
        return std::nullopt;
    return CheckedCompute(kind, *lhs, operand).transform([](unsigned long long v) { return SqlVariant { v }; });
}

} // namespace Refract
