#pragma once

#include "../codegen/code_generator.hpp"
#include "../middle_ir/layout_builder.hpp"
#include "../semantic/diagnostic.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace badlang
{
    enum class CompilationStage : std::uint8_t
    {
        Lexing,
        Parsing,
        Checking,
        Lowering,
        Complete
    };

    [[nodiscard]] std::string_view toString(CompilationStage stage) noexcept;

    struct CompilationSettings
    {
        std::string entryName{"main"};
        bool dumpSymbols{false};
        bool annotate{false};
    };

    /// Stable-coded record of a lowering or code generation invariant violation.
    struct InternalFailure
    {
        std::string code;
        std::string functionName;
        std::string detail;
    };

    struct CompilationResult
    {
        // Last stage reached; Complete only when assembly was produced.
        CompilationStage stage{CompilationStage::Lexing};
        // User-facing diagnostics in source-line order.
        std::vector<semantic::Error> errors;
        std::size_t problemCount{0};
        std::vector<InternalFailure> internalFailures;
        std::size_t declarationCount{0};
        std::string symbolDump;
        std::string assembly;

        [[nodiscard]] bool succeeded() const noexcept { return stage == CompilationStage::Complete; }
    };

    /**
     * Run the whole pipeline over one source text: lex, parse, collect declarations, resolve names and
     * types, then (only when no problem was recorded) flatten identifiers, lay out storage and emit assembly.
     */
    [[nodiscard]] CompilationResult compileSource(std::string_view source, const CompilationSettings& settings = {});
} // namespace badlang
