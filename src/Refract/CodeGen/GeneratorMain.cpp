// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../Schema/SchemaAnalyzer.hpp"
#include "../SqlLogger.hpp"
#include "CxxEntityPrinter.hpp"
#include "GeneratorMain.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace Refract
{

namespace
{

    void PrintUsage(std::string_view programName)
    {
        std::println("Usage: {} [--output FILE] [--namespace NAME] [--trace-sql]", programName);
        std::println("");
        std::println("  --output FILE       Header file to write, - (the default) writes to standard output");
        std::println("  --namespace NAME    C++ namespace the entities are generated into");
        std::println("  --trace-sql         Log every statement and generated entity");
    }

} // namespace

std::expected<GeneratorConfiguration, int> ParseGeneratorArguments(int argc, char const* argv[])
{
    auto const args = std::vector<std::string_view>(argv + 1, argv + argc);
    auto config = GeneratorConfiguration {};

    for (auto arg = args.begin(); arg != args.end(); ++arg)
    {
        // Options taking a value consume the following argument.
        auto const takeValue = [&](std::string_view& target) {
            if (std::next(arg) == args.end())
            {
                std::println(stderr, "Option {} requires a value", *arg);
                return false;
            }
            target = *++arg;
            return true;
        };

        if (*arg == "--help" || *arg == "-h")
        {
            PrintUsage(argv[0]);
            return std::unexpected { EXIT_SUCCESS };
        }
        else if (*arg == "--trace-sql")
            config.traceSql = true;
        else if (*arg == "--output")
        {
            if (!takeValue(config.outputFileName))
                return std::unexpected { EXIT_FAILURE };
        }
        else if (*arg == "--namespace")
        {
            if (!takeValue(config.modelNamespace))
                return std::unexpected { EXIT_FAILURE };
        }
        else
        {
            std::println(stderr, "Unknown option {}, see {} --help", *arg, argv[0]);
            return std::unexpected { EXIT_FAILURE };
        }
    }

    return config;
}

int RunGenerator(SchemaDeclaration const& schema, int argc, char const* argv[])
{
    auto const configOpt = ParseGeneratorArguments(argc, argv);
    if (!configOpt)
        return configOpt.error();
    auto const& config = configOpt.value();

    if (config.traceSql)
        SqlLogger::SetLogger(SqlLogger::TraceLogger());

    try
    {
        auto printer = CxxEntityPrinter { CompileSchema(schema) };

        if (config.outputFileName.empty() || config.outputFileName == "-")
            std::print("{}", printer.str(config.modelNamespace));
        else
        {
            auto file = std::ofstream(std::string(config.outputFileName));
            if (!file)
            {
                std::println(stderr, "Cannot open output file {}", config.outputFileName);
                return EXIT_FAILURE;
            }
            file << printer.str(config.modelNamespace);
        }
    }
    catch (SchemaError const& error)
    {
        SqlLogger::GetLogger().OnWarning(std::format("Generation of schema {} failed", schema.name));
        std::println(stderr, "Schema {}: {}", schema.name, error.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} // namespace Refract
