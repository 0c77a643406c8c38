// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../DataBinder/SqlVariant.hpp"
#include "../Key/EntityKey.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Refract
{

enum class FieldOperator : uint8_t
{
    Equals,
    NotEquals,
    GreaterThan,
    LessThan,
    GreaterOrEqual,
    LessOrEqual,
    Contains,
    StartsWith,
    EndsWith,
    InSet,
    NotInSet,
    IsNull,
    IsNotNull,
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

/// String comparison mode of a field, applied to every string operator on that field.
enum class QueryMode : uint8_t
{
    Default,
    Insensitive,
};

/// Which kind of null a JsonNull operator tests for.
enum class JsonNullKind : uint8_t
{
    DbNull,   // SQL NULL
    JsonNull, // the JSON literal null
    AnyNull,  // either of them
};

struct Predicate;

/// Condition on one field of the current entity.
struct FieldPredicate
{
    std::string field;
    FieldOperator op = FieldOperator::Equals;
    std::vector<SqlVariant> values;
    std::vector<std::string> jsonPath;
    JsonNullKind nullKind = JsonNullKind::DbNull;
};

/// Condition on a key field, taking a key whose type is converted to the field's type on compilation.
struct KeyPredicate
{
    std::string field;
    EntityKey key;
};

/// Sets the string comparison mode of a field. Applies to all predicates on that field in the same list.
struct ModePredicate
{
    std::string field;
    QueryMode mode = QueryMode::Default;
};

enum class LogicalOperator : uint8_t
{
    And,
    Or,
    Not,
};

struct LogicalPredicate
{
    LogicalOperator op = LogicalOperator::And;
    std::vector<Predicate> predicates;
};

enum class RelationQuantifier : uint8_t
{
    Some,
    Every,
    None,
};

/// Condition over the rows related through one relation.
struct RelationPredicate
{
    std::string relation;
    RelationQuantifier quantifier = RelationQuantifier::Some;
    std::vector<Predicate> predicates;
};

/// One element of a where-list, as built by the generated per-field functions.
struct Predicate
{
    using Node = std::variant<FieldPredicate, KeyPredicate, ModePredicate, LogicalPredicate, RelationPredicate>;

    Node node;

    Predicate() = default;

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, Predicate> && std::constructible_from<Node, T &&>)
    Predicate(T&& value):
        node(std::forward<T>(value))
    {
    }
};

/// A lookup by a unique field, e.g. the primary key or a unique email column.
struct UniqueSelector
{
    std::string field;
    std::variant<EntityKey, SqlVariant> value;

    [[nodiscard]] Predicate ToPredicate() const
    {
        if (auto const* key = std::get_if<EntityKey>(&value))
            return KeyPredicate { .field = field, .key = *key };
        return FieldPredicate { .field = field,
                                .op = FieldOperator::Equals,
                                .values = { std::get<SqlVariant>(value) } };
    }

    [[nodiscard]] std::string ToString() const
    {
        if (auto const* key = std::get_if<EntityKey>(&value))
            return std::format("{} = {}", field, *key);
        return std::format("{} = {}", field, std::get<SqlVariant>(value));
    }
};

[[nodiscard]] inline Predicate And(std::vector<Predicate> predicates)
{
    return LogicalPredicate { .op = LogicalOperator::And, .predicates = std::move(predicates) };
}

[[nodiscard]] inline Predicate Or(std::vector<Predicate> predicates)
{
    return LogicalPredicate { .op = LogicalOperator::Or, .predicates = std::move(predicates) };
}

/// Negates the conjunction of the given predicates.
[[nodiscard]] inline Predicate Not(std::vector<Predicate> predicates)
{
    return LogicalPredicate { .op = LogicalOperator::Not, .predicates = std::move(predicates) };
}

} // namespace Refract
