// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class SqlStatement;

namespace Refract
{

/// One row of an entity, with its loaded relations and relation counts.
///
/// Columns keep their insertion order. A row read from the database holds the columns in table order.
class REFRACT_API SqlRecord
{
  public:
    struct Column
    {
        std::string name;
        SqlVariant value;

        bool operator==(Column const&) const noexcept = default;
    };

    struct RelationSlot
    {
        std::string name;
        bool single = false; // BelongsTo or HasOne: at most one row
        std::vector<SqlRecord> rows;

        bool operator==(RelationSlot const&) const noexcept = default;
    };

    SqlRecord() = default;

    SqlRecord(std::initializer_list<std::pair<std::string_view, SqlVariant>> columns);

    /// Reads all columns of the current row of the statement.
    [[nodiscard]] static SqlRecord FromCurrentRow(SqlStatement& stmt);

    /// Assigns a column, appending it if it does not exist yet.
    SqlRecord& Set(std::string_view name, SqlVariant value);

    /// Removes a column. Returns false if there was none.
    bool Remove(std::string_view name);

    [[nodiscard]] bool Contains(std::string_view name) const noexcept;

    [[nodiscard]] SqlVariant const* Find(std::string_view name) const noexcept;

    /// Retrieves a column value, or throws QueryValidationError if the column is absent.
    [[nodiscard]] SqlVariant const& Get(std::string_view name) const;

    /// Retrieves a column value, or NULL if the column is absent.
    [[nodiscard]] SqlVariant GetOrNull(std::string_view name) const;

    [[nodiscard]] std::vector<Column> const& Columns() const noexcept
    {
        return m_columns;
    }

    [[nodiscard]] bool Empty() const noexcept
    {
        return m_columns.empty();
    }

    void SetRelation(std::string_view name, bool single, std::vector<SqlRecord> rows);

    [[nodiscard]] RelationSlot const* FindRelation(std::string_view name) const noexcept;

    [[nodiscard]] std::vector<RelationSlot> const& Relations() const noexcept
    {
        return m_relations;
    }

    void SetCount(std::string_view relationName, size_t count);

    [[nodiscard]] std::optional<size_t> Count(std::string_view relationName) const noexcept;

    [[nodiscard]] std::vector<std::pair<std::string, size_t>> const& Counts() const noexcept
    {
        return m_counts;
    }

    [[nodiscard]] std::string ToString() const;

    bool operator==(SqlRecord const&) const noexcept = default;

  private:
    std::vector<Column> m_columns;
    std::vector<RelationSlot> m_relations;
    std::vector<std::pair<std::string, size_t>> m_counts;
};

} // namespace Refract

template <>
struct std::formatter<Refract::SqlRecord>: std::formatter<std::string>
{
    auto format(Refract::SqlRecord const& record, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<std::string>::format(record.ToString(), ctx);
    }
};
