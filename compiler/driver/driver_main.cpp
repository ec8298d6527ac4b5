#include "command_line.hpp"
#include "pipeline.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifndef BADLANG_BUILD_PROFILE
#define BADLANG_BUILD_PROFILE "local"
#endif

namespace badlang
{
    void printHelp()
    {
        std::cout << "badc - badlang to MIPS compiler\n"
                  << "Usage: badc [options] <input>\n\n"
                  << "Options:\n"
                  << "  --help                 Show this help text and exit.\n"
                  << "  --version              Show version information and exit.\n"
                  << "  --entry=<name>         Entry-point function. Default: main.\n"
                  << "  --dump-symbols         Print the flat symbol tables after layout.\n"
                  << "  --annotate             Precede each statement's code with a source comment.\n"
                  << "  --quiet                Suppress progress lines.\n"
                  << "  -o <path>              Write assembly to the specified path instead of stdout.\n";
    }

    void printVersion()
    {
        std::cout << "badc 1.0 (build profile: " << BADLANG_BUILD_PROFILE << ")\n";
        std::cout << "Target: MIPS32 stack machine, word size " << common::kWordSize << "\n";
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    void printErrors(const CompilationResult& result)
    {
        std::cerr << '\n' << result.problemCount << " errors\n\n";
        for (const auto& error : result.errors)
        {
            std::cerr << error.render() << '\n';
        }
        std::cerr << result.problemCount << " errors\n";
    }

    int runCompiler(const CommandLineOptions& options)
    {
        // Assembly on stdout keeps stdout clean; progress moves to stderr.
        const bool assemblyToStdout = options.outputPath.empty();
        std::ostream& log = assemblyToStdout ? std::cerr : std::cout;
        const bool verbose = !options.quiet;

        if (verbose)
        {
            log << "[information] Starting badc pipeline.\n";
            log << "  input: " << options.inputPath << "\n";
            log << "  entry: " << options.entryName << "\n";
            if (!assemblyToStdout)
            {
                log << "  output: " << options.outputPath << "\n";
            }
        }

        const auto content = loadFile(options.inputPath);
        if (!content.has_value())
        {
            std::cerr << "BAD-E3000 InputReadFailed: unable to open '" << options.inputPath << "'.\n";
            return 1;
        }

        CompilationSettings settings;
        settings.entryName = options.entryName;
        settings.dumpSymbols = options.dumpSymbols;
        settings.annotate = options.annotate;
        const CompilationResult result = compileSource(*content, settings);

        if (!result.errors.empty())
        {
            printErrors(result);
            std::cerr << "BAD-W3001 Pipeline halted during " << toString(result.stage) << ".\n";
            return 1;
        }

        if (!result.internalFailures.empty())
        {
            std::cerr << "BAD-E4000 LoweringFailed: '" << options.inputPath << "' passed checking but could not be lowered.\n";
            for (const auto& failure : result.internalFailures)
            {
                std::cerr << failure.code << " invariant violation in function '" << failure.functionName
                          << "': " << failure.detail << "\n";
            }
            std::cerr << "BAD-W3001 Pipeline halted during " << toString(result.stage) << ".\n";
            return 1;
        }

        if (verbose)
        {
            log << "[notice] Checked " << result.declarationCount << " top-level declarations.\n";
        }

        if (options.dumpSymbols)
        {
            log << "[debug] Symbol tables:\n" << result.symbolDump;
        }

        if (assemblyToStdout)
        {
            std::cout << result.assembly;
            return 0;
        }

        std::ofstream out(options.outputPath, std::ios::binary);
        if (!out)
        {
            std::cerr << "BAD-E3001 OutputWriteFailed: unable to open '" << options.outputPath << "'.\n";
            return 1;
        }
        out << result.assembly;
        if (!out)
        {
            std::cerr << "BAD-E3001 OutputWriteFailed: unable to write '" << options.outputPath << "'.\n";
            return 1;
        }

        if (verbose)
        {
            log << "[notice] Assembly written to " << options.outputPath << ".\n";
        }
        return 0;
    }
} // namespace badlang

int main(int argc, char** argv)
{
    badlang::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        badlang::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        badlang::printVersion();
        return 0;
    }

    return badlang::runCompiler(options.value());
}
