// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/EntityCatalog.hpp"
#include "ConditionTree.hpp"
#include "Predicate.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

/// Translates a where-list into a condition tree.
///
/// The predicates of one list are AND-ed. Query modes are collected over the whole list (including
/// nested logical lists) before anything is compiled, so a mode applies to predicates listed before it.
/// Relation quantifiers become correlated subqueries on the related table:
///
/// - Some:  EXISTS (join AND filter)
/// - Every: NOT EXISTS (join AND NOT filter)
/// - None:  NOT EXISTS (join AND filter)
class REFRACT_API PredicateCompiler
{
  public:
    explicit PredicateCompiler(EntityCatalog const& catalog) noexcept:
        m_catalog { catalog }
    {
    }

    /// Compiles the predicates on the given entity.
    ///
    /// @param tableReference name or alias the enclosing query uses for the entity's table.
    ///
    /// @throws QueryValidationError if a field, relation or operator is not valid for the entity.
    [[nodiscard]] ConditionNode Compile(EntityInfo const& entity,
                                        std::vector<Predicate> const& predicates,
                                        std::string_view tableReference) const;

  private:
    struct Scope
    {
        EntityInfo const& entity;
        std::string tableReference;
        size_t depth = 0;
        std::map<std::string, QueryMode, std::less<>> modes;
    };

    ConditionNode CompileList(EntityInfo const& entity,
                              std::vector<Predicate> const& predicates,
                              std::string tableReference,
                              size_t depth) const;
    void CollectModes(Scope& scope, std::vector<Predicate> const& predicates) const;
    std::vector<ConditionNode> CompileEach(Scope const& scope, std::vector<Predicate> const& predicates) const;
    ConditionNode CompileField(Scope const& scope, FieldPredicate const& predicate) const;
    ConditionNode CompileKey(Scope const& scope, KeyPredicate const& predicate) const;
    ConditionNode CompileLogical(Scope const& scope, LogicalPredicate const& predicate) const;
    ConditionNode CompileRelation(Scope const& scope, RelationPredicate const& predicate) const;

    EntityCatalog const& m_catalog;
};

} // namespace Refract
