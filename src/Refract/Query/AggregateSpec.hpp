// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../DataBinder/SqlVariant.hpp"
#include "../Predicate/Predicate.hpp"
#include "ReadSpec.hpp"
#include "SqlRecord.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Refract
{

/// The aggregates computed over a set of rows.
struct AggregateSpec
{
    bool count = false;
    std::vector<std::string> sum;
    std::vector<std::string> avg;
    std::vector<std::string> min;
    std::vector<std::string> max;

    [[nodiscard]] bool Empty() const noexcept
    {
        return !count && sum.empty() && avg.empty() && min.empty() && max.empty();
    }
};

/// Aggregate values keyed by field name. A field over zero rows yields NULL.
struct AggregateResult
{
    std::optional<size_t> count;
    std::map<std::string, SqlVariant, std::less<>> sum;
    std::map<std::string, SqlVariant, std::less<>> avg;
    std::map<std::string, SqlVariant, std::less<>> min;
    std::map<std::string, SqlVariant, std::less<>> max;
};

enum class HavingOperator : uint8_t
{
    Equals,
    GreaterThan,
    LessThan,
};

/// Filter on the number of rows in a group.
struct HavingCount
{
    HavingOperator op = HavingOperator::GreaterThan;
    size_t value = 0;
};

struct GroupBySpec
{
    std::vector<std::string> by;
    std::vector<Predicate> where;
    AggregateSpec aggregates;
    std::optional<HavingCount> having;

    /// Ordering by group fields. Ordering by the group count is given by orderByCount.
    std::vector<OrderSpec> orderBy;
    std::optional<SortOrder> orderByCount;

    std::optional<size_t> take;
    std::optional<size_t> skip;
};

struct GroupByRow
{
    /// The values of the grouped fields.
    SqlRecord group;
    AggregateResult aggregates;
};

} // namespace Refract
