#include <gtest/gtest.h>

#include "code_generator.hpp"
#include "identifier_flattener.hpp"
#include "layout_builder.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace
{
    struct Lowered
    {
        badlang::frontend::Program program;
        badlang::mir::FlatSymbolTable globals;
    };

    Lowered lower(const std::string& source)
    {
        badlang::frontend::Lexer lexer{source};
        lexer.lex();
        EXPECT_TRUE(lexer.diagnostics().empty()) << "Lexer diagnostics present";

        badlang::frontend::Parser parser{lexer.tokens()};
        auto program = parser.parse();
        EXPECT_TRUE(parser.diagnostics().empty()) << "Parser diagnostics present";

        Lowered lowered;
        lowered.program = badlang::mir::flattenIdentifiers(program);
        std::vector<badlang::mir::LoweringDiagnostic> diagnostics;
        EXPECT_TRUE(badlang::mir::buildLayout(lowered.program, lowered.globals, diagnostics));
        return lowered;
    }

    std::string generate(const std::string& source, badlang::codegen::CodegenOptions options = {})
    {
        const Lowered lowered = lower(source);
        badlang::codegen::CodeGenerator generator{lowered.globals, options};

        std::string assembly;
        EXPECT_TRUE(generator.generate(lowered.program, assembly));
        EXPECT_TRUE(generator.diagnostics().empty());
        return assembly;
    }

    std::size_t occurrences(const std::string& text, const std::string& needle)
    {
        std::size_t count = 0;
        for (std::size_t position = text.find(needle); position != std::string::npos;
             position = text.find(needle, position + needle.size()))
        {
            ++count;
        }
        return count;
    }

    const std::string kTwoFunctionSource = R"(int g = 2 + 3 * 4;
fun int add(int a, int b) { return a + b; }
fun int main() {
    int x;
    x = add(g, 1);
    println x;
    return 0;
}
)";
}

namespace badlang::codegen
{
namespace
{
    TEST(CodeGeneratorTest, EmitsDataAndEntryJump)
    {
        const std::string assembly = generate(kTwoFunctionSource);

        EXPECT_EQ(assembly.rfind(".data\ng_1: .word 14\n\n.text\n.globl main\n    j main\n", 0), 0u);
        EXPECT_EQ(occurrences(assembly, ".word"), 1u);
        EXPECT_EQ(occurrences(assembly, "    j main\n"), 1u);
        EXPECT_EQ(occurrences(assembly, "\nadd_0:\n"), 1u);
        EXPECT_EQ(occurrences(assembly, "\nmain:\n"), 1u);
    }

    TEST(CodeGeneratorTest, EmitsPrologueAndEpilogue)
    {
        const std::string assembly = generate(kTwoFunctionSource);

        EXPECT_NE(assembly.find("add_0:\n"
                                "    subu $sp, $sp, 8\n"
                                "    sw $ra, 4($sp)\n"
                                "    sw $fp, 0($sp)\n"
                                "    move $fp, $sp\n"
                                "    lw $t0, 8($fp)\n"),
                  std::string::npos);
        EXPECT_NE(assembly.find("add_0_exit:\n"
                                "    move $sp, $fp\n"
                                "    lw $fp, 0($sp)\n"
                                "    lw $ra, 4($sp)\n"
                                "    addiu $sp, $sp, 8\n"
                                "    jr $ra\n"),
                  std::string::npos);
        EXPECT_NE(assembly.find("main:\n"
                                "    subu $sp, $sp, 8\n"
                                "    sw $ra, 4($sp)\n"
                                "    sw $fp, 0($sp)\n"
                                "    move $fp, $sp\n"
                                "    subu $sp, $sp, 4\n"),
                  std::string::npos);
        EXPECT_NE(assembly.find("main_exit:\n    li $v0, 10\n    syscall\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, AddressesParametersLocalsAndGlobals)
    {
        const std::string assembly = generate(kTwoFunctionSource);

        EXPECT_NE(assembly.find("    lw $t0, 8($fp)\n"), std::string::npos);
        EXPECT_NE(assembly.find("    lw $t0, 12($fp)\n"), std::string::npos);
        EXPECT_NE(assembly.find("    sw $zero, -4($fp)\n"), std::string::npos);
        EXPECT_NE(assembly.find("    sw $t0, -4($fp)\n"), std::string::npos);
        EXPECT_NE(assembly.find("    lw $t0, g_1\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, CallsPushArgumentsInReverseAndPopThem)
    {
        const std::string assembly = generate(kTwoFunctionSource);

        const auto literal = assembly.find("    li $t0, 1\n");
        const auto global = assembly.find("    lw $t0, g_1\n");
        ASSERT_NE(literal, std::string::npos);
        ASSERT_NE(global, std::string::npos);
        EXPECT_LT(literal, global);
        EXPECT_NE(assembly.find("    jal add_0\n"
                                "    addiu $sp, $sp, 8\n"
                                "    subu $sp, $sp, 4\n"
                                "    sw $v0, 0($sp)\n"),
                  std::string::npos);
    }

    TEST(CodeGeneratorTest, ReturnMovesValueAndJumpsToExit)
    {
        const std::string assembly = generate(kTwoFunctionSource);

        EXPECT_NE(assembly.find("    lw $v0, 0($sp)\n    addiu $sp, $sp, 4\n    j add_0_exit\n"), std::string::npos);
        EXPECT_NE(assembly.find("    j main_exit\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, EmitsPrintSyscalls)
    {
        const std::string assembly = generate("fun int main() {\n    print 1;\n    printsp;\n    println 2;\n    return 0;\n}\n");

        EXPECT_EQ(occurrences(assembly, "    li $v0, 1\n    syscall\n"), 2u);
        EXPECT_EQ(occurrences(assembly, "    li $a0, 32\n    li $v0, 11\n    syscall\n"), 1u);
        EXPECT_EQ(occurrences(assembly, "    li $a0, 10\n    li $v0, 11\n    syscall\n"), 1u);
    }

    TEST(CodeGeneratorTest, NumbersControlFlowLabelsWithOneCounter)
    {
        const std::string source = R"(fun int main() {
    int i = 0;
    if (i < 1) print i; else print 0;
    while (i < 3) i = i + 1;
    if (true) print 1;
    return 0;
}
)";
        const std::string assembly = generate(source);

        EXPECT_NE(assembly.find("    beq $t0, $zero, if_0_else\n"), std::string::npos);
        EXPECT_NE(assembly.find("    j if_0_end\nif_0_else:\n"), std::string::npos);
        EXPECT_NE(assembly.find("while_1_start:\n"), std::string::npos);
        EXPECT_NE(assembly.find("    j while_1_start\nwhile_1_end:\n"), std::string::npos);
        EXPECT_NE(assembly.find("if_2_else:\nif_2_end:\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, LowersArithmeticAndComparisons)
    {
        const std::string source =
            "fun int main() {\n    int a = 7 % 3;\n    bool b = a >= 1 == !false;\n    print -a;\n    return 0;\n}\n";
        const std::string assembly = generate(source);

        EXPECT_NE(assembly.find("    div $t0, $t1\n    mfhi $t0\n"), std::string::npos);
        EXPECT_NE(assembly.find("    slt $t0, $t0, $t1\n    xori $t0, $t0, 1\n"), std::string::npos);
        EXPECT_NE(assembly.find("    xor $t0, $t0, $t1\n    sltiu $t0, $t0, 1\n"), std::string::npos);
        EXPECT_NE(assembly.find("    subu $t0, $zero, $t0\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, AnnotatesStatementsWhenRequested)
    {
        CodegenOptions options;
        options.annotate = true;
        const std::string assembly = generate("fun int main() {\n    print 1;\n    return 0;\n}\n", options);

        EXPECT_NE(assembly.find("    # print (line 2)\n"), std::string::npos);
        EXPECT_NE(assembly.find("    # return (line 3)\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, SupportsCustomEntryLabel)
    {
        CodegenOptions options;
        options.entryLabel = "start";
        const Lowered lowered = [] {
            badlang::frontend::Lexer lexer{"fun int start() { return 0; }\n"};
            lexer.lex();
            badlang::frontend::Parser parser{lexer.tokens()};
            const auto program = parser.parse();

            Lowered result;
            result.program = badlang::mir::flattenIdentifiers(program, "start");
            std::vector<badlang::mir::LoweringDiagnostic> diagnostics;
            EXPECT_TRUE(badlang::mir::buildLayout(result.program, result.globals, diagnostics));
            return result;
        }();

        CodeGenerator generator{lowered.globals, options};
        std::string assembly;
        ASSERT_TRUE(generator.generate(lowered.program, assembly));
        EXPECT_NE(assembly.find(".globl start\n    j start\n"), std::string::npos);
        EXPECT_NE(assembly.find("start_exit:\n    li $v0, 10\n"), std::string::npos);
    }

    TEST(CodeGeneratorTest, RejectsMismatchedWordSize)
    {
        const Lowered lowered = lower("fun int main() { return 0; }\n");
        CodegenOptions options;
        options.wordSize = 8;
        CodeGenerator generator{lowered.globals, options};

        std::string assembly = "untouched";
        EXPECT_FALSE(generator.generate(lowered.program, assembly));
        EXPECT_EQ(assembly, "untouched");
        ASSERT_EQ(generator.diagnostics().size(), 1u);
        EXPECT_EQ(generator.diagnostics().front().code, "BAD-E4200");
    }

    TEST(CodeGeneratorTest, RejectsMissingEntryFunction)
    {
        const Lowered lowered = lower("fun int helper() { return 0; }\n");
        CodeGenerator generator{lowered.globals};

        std::string assembly;
        EXPECT_FALSE(generator.generate(lowered.program, assembly));
        ASSERT_EQ(generator.diagnostics().size(), 1u);
        EXPECT_EQ(generator.diagnostics().front().code, "BAD-E4201");
    }

    TEST(CodeGeneratorTest, RejectsTopLevelStatements)
    {
        Lowered lowered = lower("fun int main() { return 0; }\nprint 1;\n");
        CodeGenerator generator{lowered.globals};

        std::string assembly;
        EXPECT_FALSE(generator.generate(lowered.program, assembly));
        ASSERT_EQ(generator.diagnostics().size(), 1u);
        EXPECT_EQ(generator.diagnostics().front().code, "BAD-E4205");
        EXPECT_TRUE(assembly.empty());
    }
} // namespace
} // namespace badlang::codegen
