// SPDX-License-Identifier: Apache-2.0

#include "SqlQueryFormatter.hpp"

#include <algorithm>
#include <format>
#include <ranges>

using namespace std::string_view_literals;

namespace
{

bool IsArrayIndex(std::string_view segment) noexcept
{
    return !segment.empty() && std::ranges::all_of(segment, [](char c) { return c >= '0' && c <= '9'; });
}

// Escapes the LIKE wildcards of text with a backslash, and wraps it into the wildcards of the given match kind.
std::string MakeLikePattern(SqlStringMatch kind, std::string_view text, std::string_view specialCharacters)
{
    std::string pattern;
    pattern.reserve(text.size() + 2);

    if (kind != SqlStringMatch::STARTS_WITH)
        pattern += '%';

    for (char const c: text)
    {
        if (specialCharacters.find(c) != std::string_view::npos)
            pattern += '\\';
        pattern += c;
    }

    if (kind != SqlStringMatch::ENDS_WITH)
        pattern += '%';

    return pattern;
}

class SqliteQueryFormatter: public SqlQueryFormatter
{
  public:
    [[nodiscard]] std::string QueryLastInsertId(std::string_view /*tableName*/) const override
    {
        return "SELECT LAST_INSERT_ROWID()";
    }

    // OFFSET is only accepted after a LIMIT, where -1 means no limit.
    [[nodiscard]] std::string RowWindow(bool /*ordered*/,
                                        std::size_t offset,
                                        std::optional<std::size_t> limit) const override
    {
        if (limit)
            return std::format(" LIMIT {} OFFSET {}", *limit, offset);
        return std::format(" LIMIT -1 OFFSET {}", offset);
    }

    // SQLite's LIKE ignores ASCII case, so case-sensitive matching goes through GLOB.
    [[nodiscard]] std::string StringMatch(std::string_view columnExpression, bool caseInsensitive) const override
    {
        if (caseInsensitive)
            return std::format(R"(LOWER({}) LIKE LOWER(?) ESCAPE '\')", columnExpression);
        return std::format("{} GLOB ?", columnExpression);
    }

    [[nodiscard]] std::string StringMatchPattern(SqlStringMatch kind,
                                                 std::string_view text,
                                                 bool caseInsensitive) const override
    {
        if (caseInsensitive)
            return MakeLikePattern(kind, text, R"(%_\)");

        std::string pattern;
        if (kind != SqlStringMatch::STARTS_WITH)
            pattern += '*';
        for (char const c: text)
        {
            switch (c)
            {
                case '*':
                    pattern += "[*]";
                    break;
                case '?':
                    pattern += "[?]";
                    break;
                case '[':
                    pattern += "[[]";
                    break;
                default:
                    pattern += c;
                    break;
            }
        }
        if (kind != SqlStringMatch::ENDS_WITH)
            pattern += '*';
        return pattern;
    }

    [[nodiscard]] std::string JsonPathArgument(std::vector<std::string> const& path) const override
    {
        std::string result = "$";
        for (auto const& segment: path)
        {
            if (IsArrayIndex(segment))
                result += std::format("[{}]", segment);
            else
                result += std::format(".\"{}\"", segment);
        }
        return result;
    }

    [[nodiscard]] std::string JsonExtractText(std::string_view columnExpression) const override
    {
        return std::format("json_extract({}, ?)", columnExpression);
    }

    [[nodiscard]] std::string JsonArrayElementText(std::string_view columnExpression, bool last) const override
    {
        return std::format("json_extract({}, ? || '{}')", columnExpression, last ? "[#-1]" : "[0]");
    }

    [[nodiscard]] std::string JsonArrayElementsExist(std::string_view columnExpression,
                                                     std::string_view elementCondition) const override
    {
        return std::format("EXISTS (SELECT 1 FROM json_each({}, ?) WHERE {})", columnExpression, elementCondition);
    }

    [[nodiscard]] std::string JsonHasPath(std::string_view columnExpression) const override
    {
        return std::format("json_type({}, ?) IS NOT NULL", columnExpression);
    }

    [[nodiscard]] std::string JsonIsNullLiteral(std::string_view columnExpression) const override
    {
        return std::format("json_type({}) = 'null'", columnExpression);
    }

};

class SqlServerQueryFormatter final: public SqliteQueryFormatter
{
  public:
    [[nodiscard]] std::string QueryLastInsertId(std::string_view tableName) const override
    {
        return std::format("SELECT IDENT_CURRENT('{}')", tableName);
    }

    // OFFSET ... FETCH is only accepted after an ORDER BY clause.
    [[nodiscard]] std::string RowWindow(bool ordered,
                                        std::size_t offset,
                                        std::optional<std::size_t> limit) const override
    {
        auto clause = std::format("{} OFFSET {} ROWS", ordered ? "" : "\n ORDER BY (SELECT NULL)", offset);
        if (limit)
            clause += std::format(" FETCH NEXT {} ROWS ONLY", *limit);
        return clause;
    }

    [[nodiscard]] std::string StringMatch(std::string_view columnExpression, bool caseInsensitive) const override
    {
        return std::format(R"({} COLLATE {} LIKE ? ESCAPE '\')",
                           columnExpression,
                           caseInsensitive ? "Latin1_General_CI_AS" : "Latin1_General_CS_AS");
    }

    [[nodiscard]] std::string StringMatchPattern(SqlStringMatch kind,
                                                 std::string_view text,
                                                 bool /*caseInsensitive*/) const override
    {
        return MakeLikePattern(kind, text, R"(%_[\)");
    }

    [[nodiscard]] std::string CaseInsensitiveEquals(std::string_view columnExpression) const override
    {
        return std::format("{} COLLATE Latin1_General_CI_AS = ?", columnExpression);
    }

    [[nodiscard]] std::string JsonExtractText(std::string_view columnExpression) const override
    {
        return std::format("JSON_VALUE({}, ?)", columnExpression);
    }

    [[nodiscard]] std::string JsonArrayElementText(std::string_view columnExpression, bool last) const override
    {
        if (last)
            return std::format("(SELECT TOP 1 [value] FROM OPENJSON({}, ?) ORDER BY CAST([key] AS INT) DESC)",
                               columnExpression);
        return std::format("JSON_VALUE({}, CONCAT(?, '[0]'))", columnExpression);
    }

    [[nodiscard]] std::string JsonArrayElementsExist(std::string_view columnExpression,
                                                     std::string_view elementCondition) const override
    {
        return std::format("EXISTS (SELECT 1 FROM OPENJSON({}, ?) WHERE {})", columnExpression, elementCondition);
    }

    [[nodiscard]] std::string JsonHasPath(std::string_view columnExpression) const override
    {
        return std::format("JSON_PATH_EXISTS({}, ?) = 1", columnExpression);
    }

    [[nodiscard]] std::string JsonIsNullLiteral(std::string_view columnExpression) const override
    {
        return std::format("({} = 'null')", columnExpression);
    }

    // SQL Server has no NULLS FIRST/LAST, and sorts NULL values first in ascending order.
    [[nodiscard]] std::string OrderByItem(std::string_view columnExpression,
                                          SqlResultOrdering ordering,
                                          SqlNullsOrdering nulls) const override
    {
        auto const direction = ordering == SqlResultOrdering::ASCENDING ? "ASC"sv : "DESC"sv;
        if (nulls == SqlNullsOrdering::DEFAULT)
            return std::format("{} {}", columnExpression, direction);
        return std::format("CASE WHEN {} IS NULL THEN {} ELSE {} END, {} {}",
                           columnExpression,
                           nulls == SqlNullsOrdering::FIRST ? 0 : 1,
                           nulls == SqlNullsOrdering::FIRST ? 1 : 0,
                           columnExpression,
                           direction);
    }
};

class PostgreSqlFormatter final: public SqliteQueryFormatter
{
  public:
    [[nodiscard]] std::string QueryLastInsertId(std::string_view /*tableName*/) const override
    {
        // Only valid right after the INSERT on the same connection.
        return "SELECT lastval()";
    }

    [[nodiscard]] std::string RowWindow(bool /*ordered*/,
                                        std::size_t offset,
                                        std::optional<std::size_t> limit) const override
    {
        if (limit)
            return std::format(" LIMIT {} OFFSET {}", *limit, offset);
        return std::format(" OFFSET {}", offset);
    }

    [[nodiscard]] std::string StringMatch(std::string_view columnExpression, bool caseInsensitive) const override
    {
        return std::format(R"({} {} ? ESCAPE '\')", columnExpression, caseInsensitive ? "ILIKE" : "LIKE");
    }

    [[nodiscard]] std::string StringMatchPattern(SqlStringMatch kind,
                                                 std::string_view text,
                                                 bool /*caseInsensitive*/) const override
    {
        return MakeLikePattern(kind, text, R"(%_\)");
    }

    [[nodiscard]] std::string JsonPathArgument(std::vector<std::string> const& path) const override
    {
        std::string result = "{";
        for (auto const& [index, segment]: path | std::views::enumerate)
        {
            if (index > 0)
                result += ',';
            result += std::format("\"{}\"", segment);
        }
        result += '}';
        return result;
    }

    [[nodiscard]] std::string JsonExtractText(std::string_view columnExpression) const override
    {
        return std::format("({}::jsonb #>> CAST(? AS text[]))", columnExpression);
    }

    [[nodiscard]] std::string JsonArrayElementText(std::string_view columnExpression, bool last) const override
    {
        return std::format("(({}::jsonb #> CAST(? AS text[])) ->> {})", columnExpression, last ? -1 : 0);
    }

    [[nodiscard]] std::string JsonArrayElementsExist(std::string_view columnExpression,
                                                     std::string_view elementCondition) const override
    {
        return std::format(
            "EXISTS (SELECT 1 FROM jsonb_array_elements_text({}::jsonb #> CAST(? AS text[])) AS elements(value) "
            "WHERE {})",
            columnExpression,
            elementCondition);
    }

    [[nodiscard]] std::string JsonHasPath(std::string_view columnExpression) const override
    {
        return std::format("({}::jsonb #> CAST(? AS text[])) IS NOT NULL", columnExpression);
    }

    [[nodiscard]] std::string JsonIsNullLiteral(std::string_view columnExpression) const override
    {
        return std::format("({}::jsonb = 'null'::jsonb)", columnExpression);
    }
};

} // namespace

std::string SqlQueryFormatter::CaseInsensitiveEquals(std::string_view columnExpression) const
{
    return std::format("LOWER({}) = LOWER(?)", columnExpression);
}

std::string SqlQueryFormatter::OrderByItem(std::string_view columnExpression,
                                           SqlResultOrdering ordering,
                                           SqlNullsOrdering nulls) const
{
    auto const direction = ordering == SqlResultOrdering::ASCENDING ? "ASC"sv : "DESC"sv;
    switch (nulls)
    {
        case SqlNullsOrdering::FIRST:
            return std::format("{} {} NULLS FIRST", columnExpression, direction);
        case SqlNullsOrdering::LAST:
            return std::format("{} {} NULLS LAST", columnExpression, direction);
        case SqlNullsOrdering::DEFAULT:
            break;
    }
    return std::format("{} {}", columnExpression, direction);
}

SqlQueryFormatter const& SqlQueryFormatter::Sqlite()
{
    static const SqliteQueryFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::SqlServer()
{
    static const SqlServerQueryFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::PostgrSQL()
{
    static const PostgreSqlFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const* SqlQueryFormatter::Get(SqlServerType serverType) noexcept
{
    switch (serverType)
    {
        case SqlServerType::SQLITE:
            return &Sqlite();
        case SqlServerType::MICROSOFT_SQL:
            return &SqlServer();
        case SqlServerType::POSTGRESQL:
            return &PostgrSQL();
        case SqlServerType::ORACLE:
        case SqlServerType::MYSQL:
        case SqlServerType::UNKNOWN:
            break;
    }
    return nullptr;
}
