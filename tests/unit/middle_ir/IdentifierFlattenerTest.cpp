#include <gtest/gtest.h>

#include "identifier_flattener.hpp"
#include "lexer.hpp"
#include "parser.hpp"

#include <set>

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

    const std::string kShadowingSource = R"(int g = 1;
fun int add(int a, int b) { return a + b; }
fun int main() {
    int x = 5;
    {
        int x = 7;
        print x;
    }
    print x;
    return add(x, g);
}
)";
}

namespace badlang::mir
{
namespace
{
    using frontend::StatementKind;

    TEST(IdentifierFlattenerTest, RenamesEveryBindingUniquely)
    {
        const auto program = parseProgram(kShadowingSource);
        const auto flattened = flattenIdentifiers(program);

        ASSERT_EQ(flattened.statements.size(), 3u);
        EXPECT_EQ(flattened.statements[0]->name, "g_1");

        const auto& add = *flattened.statements[1];
        EXPECT_EQ(add.name, "add_0");
        ASSERT_EQ(add.parameters.size(), 2u);
        EXPECT_EQ(add.parameters[0].name, "a_2");
        EXPECT_EQ(add.parameters[1].name, "b_3");
        EXPECT_EQ(add.body.front()->expression->left->name, "a_2");
        EXPECT_EQ(add.body.front()->expression->right->name, "b_3");
    }

    TEST(IdentifierFlattenerTest, ResolvesShadowedReferences)
    {
        const auto program = parseProgram(kShadowingSource);
        const auto flattened = flattenIdentifiers(program);

        const auto& main = *flattened.statements[2];
        EXPECT_EQ(main.name, "main");
        ASSERT_EQ(main.body.size(), 4u);
        EXPECT_EQ(main.body[0]->name, "x_4");

        const auto& block = *main.body[1];
        ASSERT_EQ(block.kind, StatementKind::Block);
        EXPECT_EQ(block.body[0]->name, "x_5");
        EXPECT_EQ(block.body[1]->expression->name, "x_5");

        EXPECT_EQ(main.body[2]->expression->name, "x_4");

        const auto& call = *main.body[3]->expression;
        EXPECT_EQ(call.name, "add_0");
        EXPECT_EQ(call.arguments[0]->name, "x_4");
        EXPECT_EQ(call.arguments[1]->name, "g_1");
    }

    TEST(IdentifierFlattenerTest, LeavesInputProgramUntouched)
    {
        const auto program = parseProgram(kShadowingSource);
        const auto flattened = flattenIdentifiers(program);

        EXPECT_EQ(program.statements[0]->name, "g");
        EXPECT_EQ(program.statements[1]->name, "add");
        EXPECT_EQ(program.statements[2]->body[0]->name, "x");
    }

    TEST(IdentifierFlattenerTest, ForwardCallsUseRenamedFunction)
    {
        const std::string source = "fun int main() { return later(); }\nfun int later() { return 1; }\n";
        const auto flattened = flattenIdentifiers(parseProgram(source));

        EXPECT_EQ(flattened.statements[0]->body.front()->expression->name, "later_0");
        EXPECT_EQ(flattened.statements[1]->name, "later_0");
    }

    TEST(IdentifierFlattenerTest, KeepsCustomEntryName)
    {
        const std::string source = "fun int start() { int main = 1; return main; }\n";
        const auto flattened = flattenIdentifiers(parseProgram(source), "start");

        const auto& start = *flattened.statements.front();
        EXPECT_EQ(start.name, "start");
        EXPECT_EQ(start.body[0]->name, "main_0");
        EXPECT_EQ(start.body[1]->expression->name, "main_0");
    }

    TEST(IdentifierFlattenerTest, GeneratedNamesSkipEntryName)
    {
        const std::string source = "int a = 1;\nfun int a_0() { print a; return 0; }\n";
        const auto flattened = flattenIdentifiers(parseProgram(source), "a_0");

        ASSERT_EQ(flattened.statements.size(), 2u);
        EXPECT_EQ(flattened.statements[1]->name, "a_0");
        EXPECT_EQ(flattened.statements[0]->name, "a_1");
        EXPECT_EQ(flattened.statements[1]->body[0]->expression->name, "a_1");
    }

    TEST(IdentifierFlattenerTest, BranchScopesGetDistinctNames)
    {
        const std::string source = R"(fun int main() {
    if (true) { int t = 1; print t; } else { int t = 2; print t; }
    while (false) { int t = 3; }
    return 0;
}
)";
        const auto flattened = flattenIdentifiers(parseProgram(source));

        std::set<std::string> names;
        const auto& branch = *flattened.statements.front()->body[0];
        names.insert(branch.thenBranch->body[0]->name);
        names.insert(branch.elseBranch->body[0]->name);
        names.insert(flattened.statements.front()->body[1]->loopBody->body[0]->name);
        EXPECT_EQ(names.size(), 3u);
        EXPECT_EQ(branch.thenBranch->body[1]->expression->name, branch.thenBranch->body[0]->name);
        EXPECT_EQ(branch.elseBranch->body[1]->expression->name, branch.elseBranch->body[0]->name);
    }
} // namespace
} // namespace badlang::mir
