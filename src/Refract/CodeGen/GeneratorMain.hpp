// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Schema/SchemaDeclaration.hpp"

#include <expected>
#include <string_view>

namespace Refract
{

struct GeneratorConfiguration
{
    std::string_view outputFileName {};
    std::string_view modelNamespace {};
    bool traceSql = false;
};

/// Parses the generator's command line.
///
/// On --help or an invalid option, the error holds the exit code to return.
[[nodiscard]] REFRACT_API std::expected<GeneratorConfiguration, int> ParseGeneratorArguments(int argc,
                                                                                             char const* argv[]);

/// Compiles the schema and writes its C++ header, as a generator program's main() does.
///
/// Options:
///   --output FILE     writes the header to FILE instead of standard output
///   --namespace NAME  wraps the generated code into namespace NAME
///   --trace-sql       logs through the trace logger
///   --help            prints the usage
///
/// @return the process exit code.
REFRACT_API int RunGenerator(SchemaDeclaration const& schema, int argc, char const* argv[]);

} // namespace Refract
