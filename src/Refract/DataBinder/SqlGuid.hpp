// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

/// A UUID column value. The bytes are kept in the order they appear in the canonical text form.
struct SqlGuid
{
    std::array<uint8_t, 16> data {};

    /// Creates a random version 4 UUID.
    REFRACT_API static SqlGuid Create();

    /// Parses the 8-4-4-4-12 hex digit form, in either case.
    REFRACT_API static std::optional<SqlGuid> TryParse(std::string_view text) noexcept;

    constexpr auto operator<=>(SqlGuid const& other) const noexcept = default;
};

template <>
struct std::formatter<SqlGuid>: std::formatter<std::string>
{
    auto format(SqlGuid const& guid, format_context& ctx) const -> format_context::iterator
    {
        auto text = std::string {};
        text.reserve(36);
        for (auto const [index, byte]: std::views::enumerate(guid.data))
        {
            if (index == 4 || index == 6 || index == 8 || index == 10)
                text += '-';
            text += std::format("{:02X}", byte);
        }
        return std::formatter<std::string>::format(text, ctx);
    }
};
