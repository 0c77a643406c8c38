// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../DataBinder/SqlVariant.hpp"
#include "../Predicate/Predicate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Refract
{

enum class SortOrder : uint8_t
{
    Asc,
    Desc,
};

enum class NullsOrder : uint8_t
{
    Default,
    First,
    Last,
};

struct OrderSpec
{
    std::string field;
    SortOrder order = SortOrder::Asc;
    NullsOrder nulls = NullsOrder::Default;
};

struct RelationInclude;

/// Everything a read accumulates before execution: filter, ordering, pagination, projection and includes.
struct ReadSpec
{
    std::vector<Predicate> where;
    std::vector<OrderSpec> orderBy;

    /// Number of rows to read. A negative value reads from the end of the ordering.
    std::optional<int64_t> take;
    std::optional<size_t> skip;

    /// Exclusive lower (or, for descending order, upper) bound, compared lexicographically.
    std::vector<std::pair<std::string, SqlVariant>> cursor;

    /// Fields to read. Empty means all fields. Key fields are always read.
    std::vector<std::string> select;

    std::vector<RelationInclude> includes;

    /// Relations whose related row count is attached to each row.
    std::vector<std::string> counts;

    bool distinct = false;
};

/// A relation to load along with each row, with the read options applied to the related rows.
struct RelationInclude
{
    std::string relation;
    ReadSpec spec;
};

} // namespace Refract
