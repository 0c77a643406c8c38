// SPDX-License-Identifier: Apache-2.0

#include "SqlGuid.hpp"

#include <random>

namespace
{

std::optional<uint8_t> HexDigit(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F')
        return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

} // namespace

SqlGuid SqlGuid::Create()
{
    static thread_local auto generator = std::mt19937_64 { std::random_device {}() };

    auto guid = SqlGuid {};
    for (size_t i = 0; i < guid.data.size(); i += 8)
    {
        auto const bits = generator();
        for (size_t k = 0; k < 8; ++k)
            guid.data[i + k] = static_cast<uint8_t>(bits >> (8 * k));
    }

    guid.data[6] = static_cast<uint8_t>((guid.data[6] & 0x0F) | 0x40); // version 4
    guid.data[8] = static_cast<uint8_t>((guid.data[8] & 0x3F) | 0x80); // RFC 4122 variant
    return guid;
}

std::optional<SqlGuid> SqlGuid::TryParse(std::string_view text) noexcept
{
    if (text.size() != 36)
        return std::nullopt;

    auto guid = SqlGuid {};
    size_t nibble = 0;
    for (auto const [position, c]: std::views::enumerate(text))
    {
        bool const dashPosition = position == 8 || position == 13 || position == 18 || position == 23;
        if (dashPosition != (c == '-'))
            return std::nullopt;
        if (dashPosition)
            continue;

        auto const digit = HexDigit(c);
        if (!digit)
            return std::nullopt;
        auto& byte = guid.data[nibble / 2];
        byte = static_cast<uint8_t>(nibble % 2 == 0 ? *digit << 4 : byte | *digit);
        ++nibble;
    }
    return guid;
}
