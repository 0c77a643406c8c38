// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../SqlStatement.hpp"
#include "SqlRecord.hpp"

#include <algorithm>
#include <format>

namespace Refract
{

SqlRecord::SqlRecord(std::initializer_list<std::pair<std::string_view, SqlVariant>> columns)
{
    for (auto const& [name, value]: columns)
        Set(name, value);
}

SqlRecord SqlRecord::FromCurrentRow(SqlStatement& stmt)
{
    auto record = SqlRecord {};
    auto const columnCount = stmt.NumColumnsAffected();
    record.m_columns.reserve(columnCount);

    for (size_t i = 1; i <= columnCount; ++i)
    {
        auto const column = static_cast<SQLUSMALLINT>(i);
        record.m_columns.emplace_back(Column { .name = stmt.ColumnName(column),
                                               .value = stmt.GetColumn<SqlVariant>(column) });
    }
    return record;
}

SqlRecord& SqlRecord::Set(std::string_view name, SqlVariant value)
{
    auto const it = std::ranges::find(m_columns, name, &Column::name);
    if (it != m_columns.end())
        it->value = std::move(value);
    else
        m_columns.emplace_back(Column { .name = std::string(name), .value = std::move(value) });
    return *this;
}

bool SqlRecord::Remove(std::string_view name)
{
    auto const it = std::ranges::find(m_columns, name, &Column::name);
    if (it == m_columns.end())
        return false;
    m_columns.erase(it);
    return true;
}

bool SqlRecord::Contains(std::string_view name) const noexcept
{
    return Find(name) != nullptr;
}

SqlVariant const* SqlRecord::Find(std::string_view name) const noexcept
{
    auto const it = std::ranges::find(m_columns, name, &Column::name);
    return it != m_columns.end() ? &it->value : nullptr;
}

SqlVariant const& SqlRecord::Get(std::string_view name) const
{
    if (auto const* value = Find(name); value)
        return *value;
    throw QueryValidationError(std::format("Record has no column named {}", name));
}

SqlVariant SqlRecord::GetOrNull(std::string_view name) const
{
    if (auto const* value = Find(name); value)
        return *value;
    return SqlVariant { SqlNullValue };
}

void SqlRecord::SetRelation(std::string_view name, bool single, std::vector<SqlRecord> rows)
{
    auto const it = std::ranges::find(m_relations, name, &RelationSlot::name);
    if (it != m_relations.end())
    {
        it->single = single;
        it->rows = std::move(rows);
    }
    else
        m_relations.emplace_back(RelationSlot { .name = std::string(name), .single = single, .rows = std::move(rows) });
}

SqlRecord::RelationSlot const* SqlRecord::FindRelation(std::string_view name) const noexcept
{
    auto const it = std::ranges::find(m_relations, name, &RelationSlot::name);
    return it != m_relations.end() ? &*it : nullptr;
}

void SqlRecord::SetCount(std::string_view relationName, size_t count)
{
    auto const it = std::ranges::find_if(m_counts, [&](auto const& entry) { return entry.first == relationName; });
    if (it != m_counts.end())
        it->second = count;
    else
        m_counts.emplace_back(std::string(relationName), count);
}

std::optional<size_t> SqlRecord::Count(std::string_view relationName) const noexcept
{
    auto const it = std::ranges::find_if(m_counts, [&](auto const& entry) { return entry.first == relationName; });
    if (it != m_counts.end())
        return it->second;
    return std::nullopt;
}

std::string SqlRecord::ToString() const
{
    std::string result = "{";
    for (auto const& column: m_columns)
    {
        if (result.size() > 1)
            result += ", ";
        result += std::format("{}: {}", column.name, column.value);
    }
    for (auto const& relation: m_relations)
        result += std::format(", {}: [{} row(s)]", relation.name, relation.rows.size());
    result += '}';
    return result;
}

} // namespace Refract
