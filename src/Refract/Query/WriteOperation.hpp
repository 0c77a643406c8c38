// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Predicate/Mutation.hpp"
#include "../Predicate/Predicate.hpp"
#include "SqlRecord.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Refract
{

enum class RelationMutationKind : uint8_t
{
    Connect,      // Link existing rows, selected by a unique field
    Disconnect,   // Clear the foreign key of a BelongsTo relation
    Set,          // Replace the rows of a HasMany relation with exactly the selected rows
    CreateNested, // Insert new related rows pointing at the written row
};

[[nodiscard]] constexpr std::string_view NameOf(RelationMutationKind kind) noexcept
{
    switch (kind)
    {
        case RelationMutationKind::Connect:
            return "Connect";
        case RelationMutationKind::Disconnect:
            return "Disconnect";
        case RelationMutationKind::Set:
            return "Set";
        case RelationMutationKind::CreateNested:
            return "CreateNested";
    }
    return "Unknown";
}

struct RelationMutation
{
    std::string relation;
    RelationMutationKind kind = RelationMutationKind::Connect;
    std::vector<UniqueSelector> selectors;
    std::vector<SqlRecord> rows;
};

/// A related row looked up by a unique field just before the write it belongs to.
///
/// The selector is resolved into a row, and the row handed to apply(), which typically copies
/// its key into a foreign key field of the record being written.
struct DeferredLookup
{
    std::string entity;
    UniqueSelector selector;
    std::function<std::optional<SqlRecord>(UniqueSelector const&)> resolve;
    std::function<void(SqlRecord const&)> apply;
};

struct CreateOperation
{
    std::string entity;
    SqlRecord data;
    std::vector<RelationMutation> relations;
};

struct UpdateOperation
{
    std::string entity;
    std::vector<Predicate> where;
    std::vector<FieldMutation> mutations;
    std::vector<RelationMutation> relations;
};

struct DeleteOperation
{
    std::string entity;
    std::vector<Predicate> where;
};

/// Updates the row matching the where-list, or creates it if there is none.
struct UpsertOperation
{
    std::string entity;
    std::vector<Predicate> where;
    SqlRecord create;
    std::vector<FieldMutation> update;
};

enum class WriteKind : uint8_t
{
    Create,
    Update,
    Delete,
    Upsert,
};

using WriteOperation = std::variant<CreateOperation, UpdateOperation, DeleteOperation, UpsertOperation>;

} // namespace Refract
