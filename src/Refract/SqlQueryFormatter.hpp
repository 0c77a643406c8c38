// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlTraits.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SqlResultOrdering : uint8_t
{
    ASCENDING,
    DESCENDING
};

enum class SqlNullsOrdering : uint8_t
{
    DEFAULT,
    FIRST,
    LAST
};

// Kind of a LIKE-style string match.
enum class SqlStringMatch : uint8_t
{
    CONTAINS,
    STARTS_WITH,
    ENDS_WITH,
};

/// Renders the dialect-specific parts of the statements the query layer builds.
class REFRACT_API SqlQueryFormatter
{
  public:
    virtual ~SqlQueryFormatter() = default;

    /// Query yielding the key generated by the last INSERT into the given table.
    [[nodiscard]] virtual std::string QueryLastInsertId(std::string_view tableName) const = 0;

    /// Clause appended to a SELECT to skip @p offset rows and return at most @p limit rows.
    ///
    /// @param ordered whether the query already has an ORDER BY clause.
    [[nodiscard]] virtual std::string RowWindow(bool ordered,
                                                std::size_t offset,
                                                std::optional<std::size_t> limit) const = 0;

    /// Renders a string match of the given column expression against one bound pattern parameter.
    [[nodiscard]] virtual std::string StringMatch(std::string_view columnExpression, bool caseInsensitive) const = 0;

    /// Builds the pattern bound to StringMatch(), escaping the wildcard characters of @p text.
    [[nodiscard]] virtual std::string StringMatchPattern(SqlStringMatch kind,
                                                         std::string_view text,
                                                         bool caseInsensitive) const = 0;

    /// Renders a case-insensitive equality of the column expression and one bound parameter.
    [[nodiscard]] virtual std::string CaseInsensitiveEquals(std::string_view columnExpression) const;

    // JSON support. Every JSON path is bound as one parameter, formatted with JsonPathArgument().

    [[nodiscard]] virtual std::string JsonPathArgument(std::vector<std::string> const& path) const = 0;

    /// Text of the JSON value at the bound path.
    [[nodiscard]] virtual std::string JsonExtractText(std::string_view columnExpression) const = 0;

    /// Text of the first or last element of the JSON array at the bound path.
    [[nodiscard]] virtual std::string JsonArrayElementText(std::string_view columnExpression, bool last) const = 0;

    /// EXISTS test over the elements of the JSON array at the bound path.
    ///
    /// @param elementCondition condition on the element text, referring to it as @c value.
    [[nodiscard]] virtual std::string JsonArrayElementsExist(std::string_view columnExpression,
                                                             std::string_view elementCondition) const = 0;

    /// Tests that the bound path exists in the JSON document.
    [[nodiscard]] virtual std::string JsonHasPath(std::string_view columnExpression) const = 0;

    /// Tests that the column holds the JSON literal null (as opposed to an SQL NULL).
    [[nodiscard]] virtual std::string JsonIsNullLiteral(std::string_view columnExpression) const = 0;

    /// Renders one ORDER BY item.
    [[nodiscard]] virtual std::string OrderByItem(std::string_view columnExpression,
                                                  SqlResultOrdering ordering,
                                                  SqlNullsOrdering nulls) const;

    static SqlQueryFormatter const& Sqlite();
    static SqlQueryFormatter const& SqlServer();
    static SqlQueryFormatter const& PostgrSQL();

    /// Retrieves the formatter of the given server type, or nullptr if there is none.
    static SqlQueryFormatter const* Get(SqlServerType serverType) noexcept;
};
