#include "assembly_writer.hpp"

namespace badlang::codegen
{
    namespace
    {
        constexpr std::string_view kIndent = "    ";
    } // namespace

    AssemblyWriter::AssemblyWriter(std::ostream& stream)
        : m_stream(stream)
    {
    }

    void AssemblyWriter::directive(std::string_view text)
    {
        m_stream << text << '\n';
    }

    void AssemblyWriter::label(std::string_view name)
    {
        m_stream << name << ":\n";
    }

    void AssemblyWriter::word(std::string_view name, std::int32_t value)
    {
        m_stream << name << ": .word " << value << '\n';
    }

    void AssemblyWriter::emit(std::string_view opcode, std::string_view operands)
    {
        m_stream << kIndent << opcode;
        if (!operands.empty())
        {
            m_stream << ' ' << operands;
        }
        m_stream << '\n';
        ++m_instructionCount;
    }

    void AssemblyWriter::comment(std::string_view text)
    {
        m_stream << kIndent << "# " << text << '\n';
    }

    void AssemblyWriter::blankLine()
    {
        m_stream << '\n';
    }
} // namespace badlang::codegen
