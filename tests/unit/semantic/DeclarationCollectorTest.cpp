#include <gtest/gtest.h>

#include "declaration_collector.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace
{
    badlang::frontend::Program parseProgram(const std::string& source)
    {
        badlang::frontend::Lexer lexer{source};
        lexer.lex();
        EXPECT_TRUE(lexer.diagnostics().empty()) << "Lexer diagnostics present";

        badlang::frontend::Parser parser{lexer.tokens()};
        auto program = parser.parse();
        EXPECT_TRUE(parser.diagnostics().empty()) << "Parser diagnostics present";
        return program;
    }
}

namespace badlang::semantic
{
namespace
{
    TEST(DeclarationCollectorTest, RegistersFunctionSignatures)
    {
        const std::string source = "fun bool check(int a) { return a > 0; }\nfun int main() { return 0; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines};
        collector.collect(program);

        EXPECT_EQ(collector.problemCount(), 0u);
        const IdentifierRecord* check = collector.globals().lookup("check");
        ASSERT_NE(check, nullptr);
        EXPECT_EQ(check->kind, IdentifierKind::Function);
        EXPECT_EQ(check->type, ScalarType::Boolean);
        EXPECT_FALSE(check->initialized);
        ASSERT_EQ(check->parameters.size(), 1u);
        EXPECT_EQ(check->parameters.front().name, "a");
    }

    TEST(DeclarationCollectorTest, ReportsDuplicateFunctionAtHeader)
    {
        const std::string source = "fun int main() { return 0; }\nfun int main() { return 1; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines};
        collector.collect(program);

        ASSERT_EQ(collector.errors().size(), 1u);
        const Error& error = collector.errors().front();
        EXPECT_EQ(error.kind(), ErrorKind::Name);
        EXPECT_EQ(error.startLine(), 2u);
        EXPECT_EQ(error.problems().front().message,
                  "Function 'main' was previously declared; functions cannot be redeclared.");
    }

    TEST(DeclarationCollectorTest, RejectsGlobalStatements)
    {
        const std::string source = "int g;\ng = 4;\nfun int main() { return g; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines};
        collector.collect(program);

        ASSERT_EQ(collector.errors().size(), 1u);
        EXPECT_EQ(collector.errors().front().kind(), ErrorKind::Scope);
        EXPECT_EQ(collector.errors().front().startLine(), 2u);
    }

    TEST(DeclarationCollectorTest, RejectsCallsInGlobalInitializer)
    {
        const std::string source = "int g = 1 + seed() * seed();\nfun int seed() { return 3; }\nfun int main() { return g; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines};
        collector.collect(program);

        ASSERT_EQ(collector.errors().size(), 1u);
        EXPECT_EQ(collector.problemCount(), 2u);
        EXPECT_EQ(collector.errors().front().kind(), ErrorKind::Scope);
    }

    TEST(DeclarationCollectorTest, ReportsMissingEntryPoint)
    {
        const std::string source = "fun int helper() { return 0; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines};
        collector.collect(program);

        ASSERT_EQ(collector.errors().size(), 1u);
        const Error& error = collector.errors().front();
        EXPECT_TRUE(error.lines().empty());
        EXPECT_EQ(error.problems().front().message,
                  "No main function found; program must have a main function as the entry point.");
    }

    TEST(DeclarationCollectorTest, HonoursCustomEntryName)
    {
        const std::string source = "fun int start() { return 0; }\n";
        const auto lines = splitSourceLines(source);
        const auto program = parseProgram(source);

        DeclarationCollector collector{lines, "start"};
        collector.collect(program);

        EXPECT_EQ(collector.problemCount(), 0u);
    }
} // namespace
} // namespace badlang::semantic
