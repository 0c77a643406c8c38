// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "OperatorTable.hpp"
#include "PredicateCompiler.hpp"

#include <format>

namespace Refract
{

ConditionNode PredicateCompiler::Compile(EntityInfo const& entity,
                                         std::vector<Predicate> const& predicates,
                                         std::string_view tableReference) const
{
    return CompileList(entity, predicates, std::string(tableReference), 0);
}

ConditionNode PredicateCompiler::CompileList(EntityInfo const& entity,
                                             std::vector<Predicate> const& predicates,
                                             std::string tableReference,
                                             size_t depth) const
{
    auto scope = Scope { .entity = entity, .tableReference = std::move(tableReference), .depth = depth, .modes = {} };
    CollectModes(scope, predicates);
    return MakeAll(CompileEach(scope, predicates));
}

void PredicateCompiler::CollectModes(Scope& scope, std::vector<Predicate> const& predicates) const
{
    for (auto const& predicate: predicates)
    {
        if (auto const* mode = std::get_if<ModePredicate>(&predicate.node))
        {
            auto const& field = scope.entity.RequireField(mode->field);
            if (!IsQueryModeAllowed(field))
                throw QueryValidationError(std::format(
                    "Field {}.{} of type {} has no query mode", scope.entity.name, field.name, field.type));
            scope.modes.insert_or_assign(field.name, mode->mode);
        }
        else if (auto const* logical = std::get_if<LogicalPredicate>(&predicate.node))
            CollectModes(scope, logical->predicates);
    }
}

std::vector<ConditionNode> PredicateCompiler::CompileEach(Scope const& scope,
                                                          std::vector<Predicate> const& predicates) const
{
    auto result = std::vector<ConditionNode> {};
    result.reserve(predicates.size());

    for (auto const& predicate: predicates)
    {
        // clang-format off
        std::visit(detail::overloaded {
            [&](FieldPredicate const& p) { result.emplace_back(CompileField(scope, p)); },
            [&](KeyPredicate const& p) { result.emplace_back(CompileKey(scope, p)); },
            [&](ModePredicate const&) {},
            [&](LogicalPredicate const& p) { result.emplace_back(CompileLogical(scope, p)); },
            [&](RelationPredicate const& p) { result.emplace_back(CompileRelation(scope, p)); },
        }, predicate.node);
        // clang-format on
    }

    return result;
}

ConditionNode PredicateCompiler::CompileField(Scope const& scope, FieldPredicate const& predicate) const
{
    auto const& field = scope.entity.RequireField(predicate.field);

    if (!IsOperatorAllowed(field, predicate.op))
        throw QueryValidationError(std::format("Operator {} is not supported by field {}.{} of type {}{}",
                                               NameOf(predicate.op),
                                               scope.entity.name,
                                               field.name,
                                               field.type,
                                               field.nullable ? "" : " (not nullable)"));

    auto const mode = scope.modes.find(field.name);
    bool const caseInsensitive = mode != scope.modes.end() && mode->second == QueryMode::Insensitive;

    return ConditionNode { ColumnCondition {
        .table = scope.tableReference,
        .column = field.columnName,
        .op = predicate.op,
        .values = predicate.values,
        .caseInsensitive = caseInsensitive,
        .jsonPath = predicate.jsonPath,
        .nullKind = predicate.nullKind,
    } };
}

ConditionNode PredicateCompiler::CompileKey(Scope const& scope, KeyPredicate const& predicate) const
{
    auto const& field = scope.entity.RequireField(predicate.field);
    if (!field.unique)
        throw QueryValidationError(
            std::format("Field {}.{} is not unique and cannot select by key", scope.entity.name, field.name));

    return ConditionNode { ColumnCondition {
        .table = scope.tableReference,
        .column = field.columnName,
        .op = FieldOperator::Equals,
        .values = { predicate.key.ConvertTo(field.type) },
    } };
}

ConditionNode PredicateCompiler::CompileLogical(Scope const& scope, LogicalPredicate const& predicate) const
{
    auto children = CompileEach(scope, predicate.predicates);
    switch (predicate.op)
    {
        case LogicalOperator::And:
            return MakeAll(std::move(children));
        case LogicalOperator::Or:
            return MakeAny(std::move(children));
        case LogicalOperator::Not:
            return MakeNot(MakeAll(std::move(children)));
    }
    throw PredicateContractError(std::format("Unknown logical operator {}", static_cast<int>(predicate.op)));
}

ConditionNode PredicateCompiler::CompileRelation(Scope const& scope, RelationPredicate const& predicate) const
{
    auto const& relation = scope.entity.RequireRelation(predicate.relation);
    auto const& target = m_catalog.Require(relation.targetEntity);

    auto const alias = std::format("t{}", scope.depth + 1);
    auto filter = CompileList(target, predicate.predicates, alias, scope.depth + 1);

    auto exists = ExistsCondition {};
    exists.table = target.tableName;
    exists.alias = alias;
    exists.outerTable = scope.tableReference;

    if (relation.OwnsForeignKey())
    {
        exists.innerColumn = relation.referencedColumn;
        exists.outerColumn = relation.foreignKeyColumn;
    }
    else
    {
        exists.innerColumn = relation.foreignKeyColumn;
        exists.outerColumn = relation.referencedColumn;
    }

    switch (predicate.quantifier)
    {
        case RelationQuantifier::Some:
            exists.negated = false;
            exists.filter = std::make_unique<ConditionNode>(std::move(filter));
            break;
        case RelationQuantifier::Every:
            // No related row violates the filter.
            exists.negated = true;
            exists.filter = std::make_unique<ConditionNode>(MakeNot(std::move(filter)));
            break;
        case RelationQuantifier::None:
            exists.negated = true;
            exists.filter = std::make_unique<ConditionNode>(std::move(filter));
            break;
        default:
            throw PredicateContractError(
                std::format("Unknown relation quantifier {}", static_cast<int>(predicate.quantifier)));
    }

    return ConditionNode { std::move(exists) };
}

} // namespace Refract
