// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

// Database server families recognized after connecting.
enum class SqlServerType : uint8_t
{
    UNKNOWN,
    MICROSOFT_SQL,
    POSTGRESQL,
    ORACLE,
    SQLITE,
    MYSQL,
};
