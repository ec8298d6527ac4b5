#include "pipeline.hpp"

#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../middle_ir/identifier_flattener.hpp"
#include "../semantic/declaration_collector.hpp"
#include "../semantic/name_resolver.hpp"
#include "../semantic/type_resolver.hpp"

#include <utility>

namespace badlang
{
    std::string_view toString(CompilationStage stage) noexcept
    {
        switch (stage)
        {
        case CompilationStage::Lexing:
            return "lexing";
        case CompilationStage::Parsing:
            return "parsing";
        case CompilationStage::Checking:
            return "checking";
        case CompilationStage::Lowering:
            return "lowering";
        case CompilationStage::Complete:
            return "complete";
        }
        return "unknown";
    }

    namespace
    {
        semantic::Error toError(semantic::ErrorKind kind, const frontend::Diagnostic& diagnostic,
                                const std::vector<std::string>& sourceLines)
        {
            std::vector<semantic::Problem> problems;
            problems.push_back(semantic::Problem{diagnostic.span, diagnostic.message});
            return semantic::makeError(kind, std::move(problems), sourceLines);
        }

        template <typename Diagnostic>
        void appendFailures(const std::vector<Diagnostic>& diagnostics, std::vector<InternalFailure>& failures)
        {
            for (const auto& diagnostic : diagnostics)
            {
                failures.push_back(InternalFailure{diagnostic.code, diagnostic.functionName, diagnostic.detail});
            }
        }
    } // namespace

    CompilationResult compileSource(std::string_view source, const CompilationSettings& settings)
    {
        CompilationResult result;
        const std::vector<std::string> sourceLines = semantic::splitSourceLines(source);

        frontend::Lexer lexer{source};
        lexer.lex();
        if (!lexer.diagnostics().empty())
        {
            result.errors.push_back(toError(semantic::ErrorKind::Lex, lexer.diagnostics().front(), sourceLines));
            result.problemCount = 1;
            return result;
        }

        result.stage = CompilationStage::Parsing;
        frontend::Parser parser{lexer.tokens()};
        frontend::Program program = parser.parse();
        if (!parser.diagnostics().empty())
        {
            result.errors.push_back(toError(semantic::ErrorKind::Parse, parser.diagnostics().front(), sourceLines));
            result.problemCount = 1;
            return result;
        }
        result.declarationCount = program.statements.size();

        result.stage = CompilationStage::Checking;
        semantic::DeclarationCollector collector{sourceLines, settings.entryName};
        collector.collect(program);

        semantic::NameResolver names{collector.globals(), sourceLines};
        names.resolve(program);

        semantic::TypeResolver types{collector.globals(), sourceLines};
        types.resolve(program);

        result.errors = semantic::mergeBySourceLine({collector.errors(), names.errors(), types.errors()});
        result.problemCount = semantic::countProblems(result.errors);
        if (result.problemCount != 0)
        {
            return result;
        }

        result.stage = CompilationStage::Lowering;
        const frontend::Program flattened = mir::flattenIdentifiers(program, settings.entryName);

        mir::FlatSymbolTable globals;
        std::vector<mir::LoweringDiagnostic> loweringDiagnostics;
        if (!mir::buildLayout(flattened, globals, loweringDiagnostics))
        {
            appendFailures(loweringDiagnostics, result.internalFailures);
            return result;
        }

        if (settings.dumpSymbols)
        {
            result.symbolDump = globals.describe();
        }

        codegen::CodegenOptions options;
        options.entryLabel = settings.entryName;
        options.annotate = settings.annotate;
        codegen::CodeGenerator generator{globals, options};
        if (!generator.generate(flattened, result.assembly))
        {
            appendFailures(generator.diagnostics(), result.internalFailures);
            result.assembly.clear();
            return result;
        }

        result.stage = CompilationStage::Complete;
        return result;
    }
} // namespace badlang
