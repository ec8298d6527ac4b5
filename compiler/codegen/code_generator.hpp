#pragma once

#include "../frontend/ast.hpp"
#include "../middle_ir/symbol_table.hpp"
#include "assembly_writer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace badlang::codegen
{
    struct CodegenOptions
    {
        std::string entryLabel{"main"};
        std::uint32_t wordSize{common::kWordSize};
        // Emits a comment line before each lowered statement.
        bool annotate{false};
    };

    struct CodegenDiagnostic
    {
        std::string code;
        std::string functionName;
        std::string detail;
    };

    /**
     * Lowers a flattened, checked program to MIPS32 stack-machine assembly. Every expression leaves its value
     * on the stack; `$t0`/`$t1` are the only scratch registers and `$v0` carries return values.
     *
     * Frame layout after the prologue: the saved `$fp` at 0($fp), the saved `$ra` at 4($fp), caller-pushed
     * arguments from 8($fp) upwards and locals from -4($fp) downwards.
     */
    class CodeGenerator
    {
    public:
        explicit CodeGenerator(const mir::FlatSymbolTable& globals, CodegenOptions options = {});

        /// Returns false, leaving `assembly` untouched, when the tree breaks an invariant of the earlier passes.
        [[nodiscard]] bool generate(const frontend::Program& program, std::string& assembly);
        [[nodiscard]] const std::vector<CodegenDiagnostic>& diagnostics() const noexcept { return m_diagnostics; }

    private:
        void emitData(AssemblyWriter& writer);
        void emitFunction(AssemblyWriter& writer, const frontend::Statement& function);
        void emitStatement(AssemblyWriter& writer, const frontend::Statement& statement);
        void emitPrint(AssemblyWriter& writer, const frontend::Statement& statement, std::optional<char> trailing);
        void emitExpression(AssemblyWriter& writer, const frontend::Expression& expression);
        void emitUnary(AssemblyWriter& writer, const frontend::Expression& expression);
        void emitBinary(AssemblyWriter& writer, const frontend::Expression& expression);
        void emitCall(AssemblyWriter& writer, const frontend::Expression& expression);

        void push(AssemblyWriter& writer, std::string_view reg);
        void pop(AssemblyWriter& writer, std::string_view reg);
        [[nodiscard]] std::optional<std::string> addressOf(const std::string& name);
        [[nodiscard]] std::string exitLabel() const;
        void report(std::string code, std::string detail);

        const mir::FlatSymbolTable& m_globals;
        CodegenOptions m_options;
        const mir::FlatSymbolTable* m_locals{nullptr};
        std::string m_functionName;
        std::uint32_t m_labelCounter{0};
        std::vector<CodegenDiagnostic> m_diagnostics;
    };
} // namespace badlang::codegen
