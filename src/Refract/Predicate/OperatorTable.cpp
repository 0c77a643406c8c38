// SPDX-License-Identifier: Apache-2.0

#include "OperatorTable.hpp"

#include <algorithm>
#include <array>

namespace Refract
{

namespace
{

    using enum FieldOperator;

    constexpr auto NumericOperators = std::array {
        Equals, NotEquals, GreaterThan, LessThan, GreaterOrEqual, LessOrEqual, InSet, NotInSet,
    };

    constexpr auto StringOperators = std::array {
        Equals, NotEquals, Contains, StartsWith, EndsWith, InSet, NotInSet,
    };

    constexpr auto BooleanOperators = std::array { Equals, NotEquals };

    constexpr auto UuidOperators = std::array { Equals, NotEquals, InSet, NotInSet };

    // Comparable, but no arithmetic.
    constexpr auto TemporalOperators = std::array {
        Equals, NotEquals, GreaterThan, LessThan, GreaterOrEqual, LessOrEqual, InSet, NotInSet,
    };

    constexpr auto JsonOperators = std::array {
        Equals,
        NotEquals,
        JsonPathEquals,
        JsonStringContains,
        JsonStringStartsWith,
        JsonStringEndsWith,
        JsonArrayContains,
        JsonArrayStartsWith,
        JsonArrayEndsWith,
        JsonHasKey,
        JsonNull,
    };

    constexpr auto OpaqueOperators = std::array { Equals, NotEquals, InSet, NotInSet };

    constexpr auto SetOnly = std::array { MutationKind::Set };

    constexpr auto ArithmeticMutations = std::array {
        MutationKind::Set, MutationKind::Increment, MutationKind::Decrement, MutationKind::Multiply, MutationKind::Divide,
    };

} // namespace

std::span<FieldOperator const> OperatorsOf(TypeClass typeClass) noexcept
{
    switch (typeClass)
    {
        case TypeClass::Numeric:
            return NumericOperators;
        case TypeClass::String:
            return StringOperators;
        case TypeClass::Boolean:
            return BooleanOperators;
        case TypeClass::Uuid:
            return UuidOperators;
        case TypeClass::Temporal:
            return TemporalOperators;
        case TypeClass::Json:
            return JsonOperators;
        case TypeClass::Opaque:
            break;
    }
    return OpaqueOperators;
}

std::span<MutationKind const> MutationsOf(TypeClass typeClass) noexcept
{
    if (typeClass == TypeClass::Numeric)
        return ArithmeticMutations;
    return SetOnly;
}

std::vector<FieldOperator> AllowedOperators(FieldInfo const& field)
{
    auto const operators = OperatorsOf(ClassOf(field.type));
    auto result = std::vector<FieldOperator>(operators.begin(), operators.end());
    if (field.nullable)
    {
        result.push_back(IsNull);
        result.push_back(IsNotNull);
    }
    return result;
}

std::vector<MutationKind> AllowedMutations(FieldInfo const& field)
{
    auto const mutations = MutationsOf(ClassOf(field.type));
    auto result = std::vector<MutationKind>(mutations.begin(), mutations.end());
    if (field.nullable)
        result.push_back(MutationKind::SetNull);
    return result;
}

bool IsOperatorAllowed(FieldInfo const& field, FieldOperator op) noexcept
{
    if (op == IsNull || op == IsNotNull)
        return field.nullable;
    return std::ranges::contains(OperatorsOf(ClassOf(field.type)), op);
}

bool IsMutationAllowed(FieldInfo const& field, MutationKind kind) noexcept
{
    if (kind == MutationKind::SetNull)
        return field.nullable;
    return std::ranges::contains(MutationsOf(ClassOf(field.type)), kind);
}

bool IsQueryModeAllowed(FieldInfo const& field) noexcept
{
    return ClassOf(field.type) == TypeClass::String;
}

std::string_view NameOf(FieldOperator op) noexcept
{
    switch (op)
    {
        case Equals:
            return "Equals";
        case NotEquals:
            return "NotEquals";
        case GreaterThan:
            return "GreaterThan";
        case LessThan:
            return "LessThan";
        case GreaterOrEqual:
            return "GreaterOrEqual";
        case LessOrEqual:
            return "LessOrEqual";
        case Contains:
            return "Contains";
        case StartsWith:
            return "StartsWith";
        case EndsWith:
            return "EndsWith";
        case InSet:
            return "InSet";
        case NotInSet:
            return "NotInSet";
        case IsNull:
            return "IsNull";
        case IsNotNull:
            return "IsNotNull";
        case JsonPathEquals:
            return "JsonPathEquals";
        case JsonStringContains:
            return "JsonStringContains";
        case JsonStringStartsWith:
            return "JsonStringStartsWith";
        case JsonStringEndsWith:
            return "JsonStringEndsWith";
        case JsonArrayContains:
            return "JsonArrayContains";
        case JsonArrayStartsWith:
            return "JsonArrayStartsWith";
        case JsonArrayEndsWith:
            return "JsonArrayEndsWith";
        case JsonHasKey:
            return "JsonHasKey";
        case JsonNull:
            return "JsonNull";
    }
    return "Unknown";
}

std::string_view NameOf(MutationKind kind) noexcept
{
    switch (kind)
    {
        case MutationKind::Set:
            return "Set";
        case MutationKind::SetNull:
            return "SetNull";
        case MutationKind::Increment:
            return "Increment";
        case MutationKind::Decrement:
            return "Decrement";
        case MutationKind::Multiply:
            return "Multiply";
        case MutationKind::Divide:
            return "Divide";
    }
    return "Unknown";
}

} // namespace Refract
