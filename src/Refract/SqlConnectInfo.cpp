// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace
{

// Length of the leading KEY=VALUE attribute, where a {braced} value may contain semicolons.
size_t AttributeLength(std::string_view text) noexcept
{
    bool braced = false;
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '{')
            braced = true;
        else if (text[i] == '}')
            braced = false;
        else if (text[i] == ';' && !braced)
            return i;
    }
    return text.size();
}

bool IsPasswordKey(std::string_view key) noexcept
{
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.front())))
        key.remove_prefix(1);
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back())))
        key.remove_suffix(1);

    auto const equalsIgnoringCase = [&](std::string_view name) {
        return std::ranges::equal(key, name, [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
        });
    };
    return equalsIgnoringCase("PWD") || equalsIgnoringCase("PASSWORD");
}

} // namespace

std::string SqlConnectionString::Sanitized() const
{
    auto result = std::string {};
    auto rest = std::string_view { value };
    while (!rest.empty())
    {
        auto const length = AttributeLength(rest);
        auto const attribute = rest.substr(0, length);
        rest.remove_prefix((std::min)(length + 1, rest.size()));

        if (!result.empty())
            result += ';';

        auto const separator = attribute.find('=');
        if (separator != std::string_view::npos && IsPasswordKey(attribute.substr(0, separator)))
            result += std::format("{}=***", attribute.substr(0, separator));
        else
            result += attribute;
    }
    return result;
}
