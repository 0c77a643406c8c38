// SPDX-License-Identifier: Apache-2.0

#include "NameConversion.hpp"

#include <cctype>

namespace Refract
{

namespace
{

    bool IsUpper(char c) noexcept
    {
        return c >= 'A' && c <= 'Z';
    }

    bool IsLower(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }

} // namespace

std::string ToSnakeCase(std::string_view name)
{
    std::string result;
    result.reserve(name.size() + 4);

    for (size_t i = 0; i < name.size(); ++i)
    {
        char const c = name[i];
        if (IsUpper(c))
        {
            // "UserID" -> "user_id", "HTTPServer" -> "http_server"
            bool const afterLower = i > 0 && IsLower(name[i - 1]);
            bool const beforeLower = i > 0 && i + 1 < name.size() && IsUpper(name[i - 1]) && IsLower(name[i + 1]);
            if ((afterLower || beforeLower) && !result.empty() && result.back() != '_')
                result += '_';
            result += static_cast<char>(c - 'A' + 'a');
        }
        else
            result += c;
    }
    return result;
}

std::string ToPascalCase(std::string_view name)
{
    std::string result;
    result.reserve(name.size());

    bool upperNext = true;
    for (char const c: name)
    {
        if (c == '_')
        {
            upperNext = true;
            continue;
        }
        if (upperNext && c >= 'a' && c <= 'z')
            result += static_cast<char>(c - 'a' + 'A');
        else
            result += c;
        upperNext = false;
    }
    return result;
}

std::string ToLowerAscii(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (char const c: text)
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string_view LastPathSegment(std::string_view path) noexcept
{
    auto const pos = path.rfind("::");
    if (pos == std::string_view::npos)
        return path;
    return path.substr(pos + 2);
}

std::string NormalizeEntityName(std::string_view name)
{
    return ToLowerAscii(LastPathSegment(name));
}

std::string DefaultTableName(std::string_view entityName)
{
    return ToSnakeCase(LastPathSegment(entityName)) + 's';
}

} // namespace Refract
