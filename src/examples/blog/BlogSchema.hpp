// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <Refract/Schema/SchemaDeclaration.hpp>

namespace blog
{

/// Users writing posts, posts with comments, and an optional profile per user.
Refract::SchemaDeclaration BlogSchema();

} // namespace blog
