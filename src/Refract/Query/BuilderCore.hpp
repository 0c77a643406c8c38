// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Error.hpp"
#include "../Predicate/Predicate.hpp"
#include "../Schema/Entity.hpp"
#include "SqlRecord.hpp"

#include <concepts>
#include <format>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace Refract
{

/// A typed row as produced by the code generator: convertible to and from SqlRecord, with static metadata.
// clang-format off
template <typename Record>
concept EntityRecord = requires(Record const& record, SqlRecord const& row)
{
    { Record::Metadata() } -> std::convertible_to<EntityInfo const&>;
    { record.ToRecord() } -> std::convertible_to<SqlRecord>;
    { Record::FromRecord(row) } -> std::convertible_to<Record>;
};
// clang-format on

/// Builders return either typed records or untyped SqlRecord values.
template <typename Record>
concept ResultRecord = std::same_as<Record, SqlRecord> || EntityRecord<Record>;

template <ResultRecord Record>
[[nodiscard]] Record FromSqlRecord(SqlRecord&& row)
{
    if constexpr (std::same_as<Record, SqlRecord>)
        return std::move(row);
    else
        return Record::FromRecord(row);
}

template <ResultRecord Record>
[[nodiscard]] std::vector<Record> FromSqlRecords(std::vector<SqlRecord>&& rows)
{
    if constexpr (std::same_as<Record, SqlRecord>)
        return std::move(rows);
    else
    {
        auto result = std::vector<Record> {};
        result.reserve(rows.size());
        for (auto& row: rows)
            result.emplace_back(Record::FromRecord(row));
        return result;
    }
}

template <typename Record>
[[nodiscard]] SqlRecord ToSqlRecord(Record const& record)
{
    if constexpr (std::same_as<Record, SqlRecord>)
        return record;
    else
        return record.ToRecord();
}

/// Compares two single-relation slots of generated records by the rows they hold.
template <typename Related>
[[nodiscard]] bool SameRelated(std::shared_ptr<Related> const& lhs, std::shared_ptr<Related> const& rhs)
{
    return lhs == rhs || (lhs && rhs && *lhs == *rhs);
}

/// Builders execute once. A second Exec() throws instead of silently running the query again.
class SingleUseQuery
{
  protected:
    /// @throws QueryValidationError if the builder was executed before.
    void Consume(std::string_view entityName)
    {
        if (m_consumed)
            throw QueryValidationError(std::format("Query builder on {} was already executed", entityName));
        m_consumed = true;
    }

  private:
    bool m_consumed = false;
};

/// CRTP base of the builders that carry a where-list.
///
/// The derived class provides WhereList(). All predicates added are AND-ed.
template <typename Derived>
class WhereListBuilder
{
  public:
    template <typename... Predicates>
        requires(sizeof...(Predicates) > 0 && (std::convertible_to<Predicates, Predicate> && ...))
    Derived& Where(Predicates&&... predicates)
    {
        auto& where = static_cast<Derived*>(this)->WhereList();
        (where.emplace_back(std::forward<Predicates>(predicates)), ...);
        return static_cast<Derived&>(*this);
    }

    Derived& Where(std::vector<Predicate> predicates)
    {
        auto& where = static_cast<Derived*>(this)->WhereList();
        for (auto& predicate: predicates)
            where.emplace_back(std::move(predicate));
        return static_cast<Derived&>(*this);
    }
};

} // namespace Refract
