#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace badlang::codegen
{
    /// Formats MIPS assembly text: directives and labels flush left, instructions indented.
    class AssemblyWriter
    {
    public:
        explicit AssemblyWriter(std::ostream& stream);

        void directive(std::string_view text);
        void label(std::string_view name);
        void word(std::string_view name, std::int32_t value);
        void emit(std::string_view opcode, std::string_view operands = {});
        void comment(std::string_view text);
        void blankLine();

        [[nodiscard]] std::size_t instructionCount() const noexcept { return m_instructionCount; }

    private:
        std::ostream& m_stream;
        std::size_t m_instructionCount{0};
    };
} // namespace badlang::codegen
