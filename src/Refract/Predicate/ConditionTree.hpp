// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "Predicate.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

class SqlQueryFormatter;

namespace Refract
{

struct ConditionNode;

/// Always true or always false.
struct ConstantCondition
{
    bool value = true;
};

/// A column compared against zero or more bound values.
struct ColumnCondition
{
    std::string table; // Table name or alias qualifying the column
    std::string column;
    FieldOperator op = FieldOperator::Equals;
    std::vector<SqlVariant> values;
    bool caseInsensitive = false;
    std::vector<std::string> jsonPath;
    JsonNullKind nullKind = JsonNullKind::DbNull;
};

enum class JunctionKind : uint8_t
{
    All,
    Any,
};

struct JunctionCondition
{
    JunctionKind kind = JunctionKind::All;
    std::vector<ConditionNode> children;
};

struct NotCondition
{
    std::unique_ptr<ConditionNode> child;
};

/// [NOT] EXISTS over a correlated subquery on a related table.
struct ExistsCondition
{
    bool negated = false;
    std::string table;
    std::string alias;
    std::string innerColumn; // Column of the related table
    std::string outerTable;  // Table name or alias of the enclosing query
    std::string outerColumn;
    std::unique_ptr<ConditionNode> filter;
};

/// Backend-neutral condition tree, rendered to SQL by RenderCondition().
struct ConditionNode
{
    using Node = std::variant<ConstantCondition, ColumnCondition, JunctionCondition, NotCondition, ExistsCondition>;

    Node node;
};

[[nodiscard]] inline ConditionNode MakeTrue()
{
    return ConditionNode { ConstantCondition { true } };
}

[[nodiscard]] inline ConditionNode MakeAll(std::vector<ConditionNode> children)
{
    return ConditionNode { JunctionCondition { JunctionKind::All, std::move(children) } };
}

[[nodiscard]] inline ConditionNode MakeAny(std::vector<ConditionNode> children)
{
    return ConditionNode { JunctionCondition { JunctionKind::Any, std::move(children) } };
}

[[nodiscard]] inline ConditionNode MakeNot(ConditionNode child)
{
    return ConditionNode { NotCondition { std::make_unique<ConditionNode>(std::move(child)) } };
}

/// Tests if the condition holds for every row without looking at it, e.g. an empty where-list.
[[nodiscard]] inline bool IsTriviallyTrue(ConditionNode const& condition) noexcept
{
    if (auto const* constant = std::get_if<ConstantCondition>(&condition.node))
        return constant->value;
    if (auto const* junction = std::get_if<JunctionCondition>(&condition.node))
    {
        if (junction->kind == JunctionKind::Any)
            return false;
        for (auto const& child: junction->children)
            if (!IsTriviallyTrue(child))
                return false;
        return true;
    }
    return false;
}

/// Renders the condition as SQL text of the given dialect.
///
/// Values are never spliced into the text. They are appended to @p bindings in the order of
/// their placeholders.
[[nodiscard]] REFRACT_API std::string RenderCondition(ConditionNode const& condition,
                                                      SqlQueryFormatter const& formatter,
                                                      std::vector<SqlVariant>& bindings);

} // namespace Refract
