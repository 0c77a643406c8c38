// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "SqlRecord.hpp"

#include <string_view>
#include <vector>

class SqlConnection;

namespace Refract
{

/// Runs a statement of the connection's dialect and returns its rows, keyed by column name.
///
/// The parameters are bound to the statement's '?' placeholders in order.
[[nodiscard]] REFRACT_API std::vector<SqlRecord> ExecuteRaw(SqlConnection& connection,
                                                            std::string_view sql,
                                                            std::vector<SqlVariant> const& parameters = {});

/// Runs a statement that yields no rows and returns the number of rows it affected.
REFRACT_API size_t ExecuteRawStatement(SqlConnection& connection,
                                       std::string_view sql,
                                       std::vector<SqlVariant> const& parameters = {});

} // namespace Refract
