#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace badlang
{
    struct CommandLineOptions
    {
        std::string inputPath;
        std::string outputPath;
        std::string entryName{"main"};
        bool showHelp{false};
        bool showVersion{false};
        bool dumpSymbols{false};
        bool annotate{false};
        bool quiet{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--dump-symbols")
                {
                    options.dumpSymbols = true;
                    continue;
                }

                if (argument == "--annotate")
                {
                    options.annotate = true;
                    continue;
                }

                if (argument == "--quiet")
                {
                    options.quiet = true;
                    continue;
                }

                if (argument.rfind("--entry=", 0) == 0)
                {
                    constexpr std::string_view entryOpt = "--entry=";
                    options.entryName = std::string{argument.substr(entryOpt.size())};
                    if (options.entryName.empty())
                    {
                        std::cerr << "BAD-E1004 EmptyEntry: --entry requires a function name.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputPath = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "BAD-E1000 MissingOutput: expected path after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "BAD-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                if (!options.inputPath.empty())
                {
                    std::cerr << "BAD-E1003 MultipleInputs: only one source file may be compiled at a time.\n";
                    return std::nullopt;
                }
                options.inputPath = std::string{argument};
            }

            if (!options.showHelp && !options.showVersion && options.inputPath.empty())
            {
                std::cerr << "BAD-E1002 MissingInput: an input file is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace badlang
