// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <compare>
#include <format>
#include <string>

/// Represents an ODBC connection string, as passed to SQLDriverConnect().
struct SqlConnectionString
{
    std::string value;

    REFRACT_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// Returns the connection string with the PWD and PASSWORD values masked, suitable for logging.
    [[nodiscard]] REFRACT_API std::string Sanitized() const;
};

template <>
struct std::formatter<SqlConnectionString>: std::formatter<std::string>
{
    auto format(SqlConnectionString const& connectionString, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(connectionString.Sanitized(), ctx);
    }
};
