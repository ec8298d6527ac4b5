#include "code_generator.hpp"

#include <sstream>

namespace badlang::codegen
{
    using frontend::Expression;
    using frontend::ExpressionKind;
    using frontend::Operator;
    using frontend::Statement;
    using frontend::StatementKind;

    namespace
    {
        constexpr std::int32_t kPrintIntegerService = 1;
        constexpr std::int32_t kExitService = 10;
        constexpr std::int32_t kPrintCharacterService = 11;
        // Saved $fp and $ra sit between the frame pointer and the first argument.
        constexpr std::uint32_t kSavedRegisterWords = 2;

        std::string operands(std::string_view a, std::string_view b)
        {
            return std::string{a} + ", " + std::string{b};
        }

        std::string operands(std::string_view a, std::string_view b, std::string_view c)
        {
            return std::string{a} + ", " + std::string{b} + ", " + std::string{c};
        }

        std::string_view describe(StatementKind kind)
        {
            switch (kind)
            {
            case StatementKind::Block: return "block";
            case StatementKind::Expression: return "expression";
            case StatementKind::Variable: return "variable";
            case StatementKind::Function: return "function";
            case StatementKind::Assign: return "assign";
            case StatementKind::If: return "if";
            case StatementKind::While: return "while";
            case StatementKind::Return: return "return";
            case StatementKind::Print: return "print";
            case StatementKind::PrintSpace: return "printsp";
            case StatementKind::PrintLine: return "println";
            }
            return "statement";
        }
    } // namespace

    CodeGenerator::CodeGenerator(const mir::FlatSymbolTable& globals, CodegenOptions options)
        : m_globals(globals)
        , m_options(std::move(options))
    {
    }

    bool CodeGenerator::generate(const frontend::Program& program, std::string& assembly)
    {
        m_diagnostics.clear();
        m_labelCounter = 0;
        m_locals = nullptr;
        m_functionName.clear();

        if (m_options.wordSize != m_globals.wordSize())
        {
            report("BAD-E4200", "Word size " + std::to_string(m_options.wordSize) +
                                    " does not match the symbol table word size " +
                                    std::to_string(m_globals.wordSize()) + ".");
            return false;
        }

        const mir::SymbolEntry* entry = m_globals.find(m_options.entryLabel);
        if (entry == nullptr || entry->kind != mir::SymbolKind::Function)
        {
            report("BAD-E4201", "Entry function '" + m_options.entryLabel + "' is not in the symbol table.");
            return false;
        }

        std::ostringstream stream;
        AssemblyWriter writer{stream};

        emitData(writer);

        writer.blankLine();
        writer.directive(".text");
        writer.directive(".globl " + m_options.entryLabel);
        writer.emit("j", m_options.entryLabel);

        for (const auto& statement : program.statements)
        {
            switch (statement->kind)
            {
            case StatementKind::Function:
                emitFunction(writer, *statement);
                break;
            case StatementKind::Variable:
                // Globals live in the data section.
                break;
            default:
                report("BAD-E4205", "Top-level " + std::string{describe(statement->kind)} +
                                        " statement cannot be lowered.");
                break;
            }
        }

        if (!m_diagnostics.empty())
        {
            return false;
        }

        assembly = stream.str();
        return true;
    }

    void CodeGenerator::emitData(AssemblyWriter& writer)
    {
        writer.directive(".data");
        for (const mir::SymbolEntry* global : m_globals.variables())
        {
            writer.word(global->name, global->initialValue.value_or(0));
        }
    }

    void CodeGenerator::emitFunction(AssemblyWriter& writer, const Statement& function)
    {
        const mir::SymbolEntry* entry = m_globals.find(function.name);
        if (entry == nullptr || entry->kind != mir::SymbolKind::Function || !entry->locals)
        {
            report("BAD-E4201", "Function '" + function.name + "' is not in the symbol table.");
            return;
        }

        m_functionName = function.name;
        m_locals = entry->locals.get();

        const std::string word = std::to_string(m_options.wordSize);
        const std::string savedSize = std::to_string(kSavedRegisterWords * m_options.wordSize);

        writer.blankLine();
        writer.label(function.name);
        writer.emit("subu", operands("$sp", "$sp", savedSize));
        writer.emit("sw", operands("$ra", word + "($sp)"));
        writer.emit("sw", operands("$fp", "0($sp)"));
        writer.emit("move", operands("$fp", "$sp"));
        if (m_locals->localSize() > 0)
        {
            writer.emit("subu", operands("$sp", "$sp", std::to_string(m_locals->localSize())));
        }

        for (const auto& statement : function.body)
        {
            emitStatement(writer, *statement);
        }

        writer.label(exitLabel());
        if (function.name == m_options.entryLabel)
        {
            writer.emit("li", operands("$v0", std::to_string(kExitService)));
            writer.emit("syscall");
        }
        else
        {
            writer.emit("move", operands("$sp", "$fp"));
            writer.emit("lw", operands("$fp", "0($sp)"));
            writer.emit("lw", operands("$ra", word + "($sp)"));
            writer.emit("addiu", operands("$sp", "$sp", savedSize));
            writer.emit("jr", "$ra");
        }

        m_locals = nullptr;
        m_functionName.clear();
    }

    void CodeGenerator::emitStatement(AssemblyWriter& writer, const Statement& statement)
    {
        if (m_options.annotate)
        {
            writer.comment(std::string{describe(statement.kind)} + " (line " +
                           std::to_string(statement.span.begin.line) + ")");
        }

        switch (statement.kind)
        {
        case StatementKind::Block:
            for (const auto& child : statement.body)
            {
                emitStatement(writer, *child);
            }
            break;
        case StatementKind::Expression:
            emitExpression(writer, *statement.expression);
            writer.emit("addiu", operands("$sp", "$sp", std::to_string(m_options.wordSize)));
            break;
        case StatementKind::Variable:
        case StatementKind::Assign:
        {
            const auto address = addressOf(statement.name);
            if (!address.has_value())
            {
                break;
            }
            if (statement.expression)
            {
                emitExpression(writer, *statement.expression);
                pop(writer, "$t0");
                writer.emit("sw", operands("$t0", *address));
            }
            else
            {
                writer.emit("sw", operands("$zero", *address));
            }
            break;
        }
        case StatementKind::If:
        {
            const std::string id = std::to_string(m_labelCounter++);
            const std::string elseLabel = "if_" + id + "_else";
            const std::string endLabel = "if_" + id + "_end";

            emitExpression(writer, *statement.expression);
            pop(writer, "$t0");
            writer.emit("beq", operands("$t0", "$zero", elseLabel));
            emitStatement(writer, *statement.thenBranch);
            writer.emit("j", endLabel);
            writer.label(elseLabel);
            if (statement.elseBranch)
            {
                emitStatement(writer, *statement.elseBranch);
            }
            writer.label(endLabel);
            break;
        }
        case StatementKind::While:
        {
            const std::string id = std::to_string(m_labelCounter++);
            const std::string startLabel = "while_" + id + "_start";
            const std::string endLabel = "while_" + id + "_end";

            writer.label(startLabel);
            emitExpression(writer, *statement.expression);
            pop(writer, "$t0");
            writer.emit("beq", operands("$t0", "$zero", endLabel));
            emitStatement(writer, *statement.loopBody);
            writer.emit("j", startLabel);
            writer.label(endLabel);
            break;
        }
        case StatementKind::Return:
            if (m_locals == nullptr)
            {
                report("BAD-E4204", "Return statement outside of a function.");
                break;
            }
            emitExpression(writer, *statement.expression);
            pop(writer, "$v0");
            writer.emit("j", exitLabel());
            break;
        case StatementKind::Print:
            emitPrint(writer, statement, std::nullopt);
            break;
        case StatementKind::PrintSpace:
            emitPrint(writer, statement, ' ');
            break;
        case StatementKind::PrintLine:
            emitPrint(writer, statement, '\n');
            break;
        case StatementKind::Function:
            report("BAD-E4203", "Function '" + statement.name + "' is nested inside another function.");
            break;
        }
    }

    void CodeGenerator::emitPrint(AssemblyWriter& writer, const Statement& statement, std::optional<char> trailing)
    {
        if (statement.expression)
        {
            emitExpression(writer, *statement.expression);
            pop(writer, "$a0");
            writer.emit("li", operands("$v0", std::to_string(kPrintIntegerService)));
            writer.emit("syscall");
        }

        if (trailing.has_value())
        {
            writer.emit("li", operands("$a0", std::to_string(static_cast<int>(*trailing))));
            writer.emit("li", operands("$v0", std::to_string(kPrintCharacterService)));
            writer.emit("syscall");
        }
    }

    void CodeGenerator::emitExpression(AssemblyWriter& writer, const Expression& expression)
    {
        switch (expression.kind)
        {
        case ExpressionKind::Literal:
        {
            std::int32_t value = expression.integerValue;
            if (expression.literalType == common::ScalarType::Boolean)
            {
                value = expression.booleanValue ? 1 : 0;
            }
            else if (expression.literalType != common::ScalarType::Integer)
            {
                report("BAD-E4206", "Literal has no concrete type.");
                return;
            }
            writer.emit("li", operands("$t0", std::to_string(value)));
            push(writer, "$t0");
            break;
        }
        case ExpressionKind::Variable:
        {
            const auto address = addressOf(expression.name);
            if (!address.has_value())
            {
                return;
            }
            writer.emit("lw", operands("$t0", *address));
            push(writer, "$t0");
            break;
        }
        case ExpressionKind::Unary:
            emitUnary(writer, expression);
            break;
        case ExpressionKind::Binary:
            emitBinary(writer, expression);
            break;
        case ExpressionKind::Call:
            emitCall(writer, expression);
            break;
        }
    }

    void CodeGenerator::emitUnary(AssemblyWriter& writer, const Expression& expression)
    {
        emitExpression(writer, *expression.operand);
        pop(writer, "$t0");

        switch (expression.op)
        {
        case Operator::Minus:
            writer.emit("subu", operands("$t0", "$zero", "$t0"));
            break;
        case Operator::Plus:
            break;
        case Operator::Not:
            writer.emit("xori", operands("$t0", "$t0", "1"));
            break;
        default:
            report("BAD-E4202", "Operator '" + std::string{frontend::toString(expression.op)} +
                                    "' is not a unary operator.");
            return;
        }

        push(writer, "$t0");
    }

    void CodeGenerator::emitBinary(AssemblyWriter& writer, const Expression& expression)
    {
        emitExpression(writer, *expression.left);
        emitExpression(writer, *expression.right);
        // Right operand was pushed last.
        pop(writer, "$t1");
        pop(writer, "$t0");

        switch (expression.op)
        {
        case Operator::Plus:
            writer.emit("addu", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Minus:
            writer.emit("subu", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Multiply:
            writer.emit("mul", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Divide:
            writer.emit("div", operands("$t0", "$t1"));
            writer.emit("mflo", "$t0");
            break;
        case Operator::Modulo:
            writer.emit("div", operands("$t0", "$t1"));
            writer.emit("mfhi", "$t0");
            break;
        case Operator::And:
            writer.emit("and", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Or:
            writer.emit("or", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Less:
            writer.emit("slt", operands("$t0", "$t0", "$t1"));
            break;
        case Operator::Greater:
            writer.emit("slt", operands("$t0", "$t1", "$t0"));
            break;
        case Operator::LessEqual:
            writer.emit("slt", operands("$t0", "$t1", "$t0"));
            writer.emit("xori", operands("$t0", "$t0", "1"));
            break;
        case Operator::GreaterEqual:
            writer.emit("slt", operands("$t0", "$t0", "$t1"));
            writer.emit("xori", operands("$t0", "$t0", "1"));
            break;
        case Operator::Equal:
            writer.emit("xor", operands("$t0", "$t0", "$t1"));
            writer.emit("sltiu", operands("$t0", "$t0", "1"));
            break;
        case Operator::NotEqual:
            writer.emit("xor", operands("$t0", "$t0", "$t1"));
            writer.emit("sltu", operands("$t0", "$zero", "$t0"));
            break;
        case Operator::Not:
            report("BAD-E4202", "Operator '!' is not a binary operator.");
            return;
        }

        push(writer, "$t0");
    }

    void CodeGenerator::emitCall(AssemblyWriter& writer, const Expression& expression)
    {
        const mir::SymbolEntry* callee = m_globals.find(expression.name);
        if (callee == nullptr || callee->kind != mir::SymbolKind::Function)
        {
            report("BAD-E4201", "Call target '" + expression.name + "' is not a function in the symbol table.");
            return;
        }

        // Last argument first, so the first argument ends up nearest the callee's frame pointer.
        for (auto it = expression.arguments.rbegin(); it != expression.arguments.rend(); ++it)
        {
            emitExpression(writer, **it);
        }

        writer.emit("jal", expression.name);
        if (!expression.arguments.empty())
        {
            const auto argumentBytes = static_cast<std::uint32_t>(expression.arguments.size()) * m_options.wordSize;
            writer.emit("addiu", operands("$sp", "$sp", std::to_string(argumentBytes)));
        }
        push(writer, "$v0");
    }

    void CodeGenerator::push(AssemblyWriter& writer, std::string_view reg)
    {
        writer.emit("subu", operands("$sp", "$sp", std::to_string(m_options.wordSize)));
        writer.emit("sw", operands(reg, "0($sp)"));
    }

    void CodeGenerator::pop(AssemblyWriter& writer, std::string_view reg)
    {
        writer.emit("lw", operands(reg, "0($sp)"));
        writer.emit("addiu", operands("$sp", "$sp", std::to_string(m_options.wordSize)));
    }

    std::optional<std::string> CodeGenerator::addressOf(const std::string& name)
    {
        if (m_locals != nullptr)
        {
            if (const mir::SymbolEntry* local = m_locals->find(name))
            {
                if (local->kind == mir::SymbolKind::Parameter)
                {
                    const std::uint32_t offset = kSavedRegisterWords * m_options.wordSize + local->offset;
                    return std::to_string(offset) + "($fp)";
                }
                if (local->kind == mir::SymbolKind::Variable)
                {
                    const std::uint32_t offset = m_options.wordSize + local->offset;
                    return "-" + std::to_string(offset) + "($fp)";
                }
            }
        }

        const mir::SymbolEntry* global = m_globals.find(name);
        if (global != nullptr && global->kind == mir::SymbolKind::Variable)
        {
            return global->name;
        }

        report("BAD-E4201", "Variable '" + name + "' is not in any symbol table.");
        return std::nullopt;
    }

    std::string CodeGenerator::exitLabel() const
    {
        return m_functionName + "_exit";
    }

    void CodeGenerator::report(std::string code, std::string detail)
    {
        CodegenDiagnostic diagnostic;
        diagnostic.code = std::move(code);
        diagnostic.functionName = m_functionName;
        diagnostic.detail = std::move(detail);
        m_diagnostics.emplace_back(std::move(diagnostic));
    }
} // namespace badlang::codegen
