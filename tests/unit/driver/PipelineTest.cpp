#include <gtest/gtest.h>

#include "pipeline.hpp"

namespace badlang
{
namespace
{
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

    TEST(PipelineTest, CompilesValidProgram)
    {
        const std::string source = R"(int g = 2 + 3 * 4;
fun int twice(int v) { return v * 2; }
fun int main() {
    int x = 5;
    {
        int x = 7;
        println x;
    }
    println twice(x) + g;
    return 0;
}
)";

        CompilationSettings settings;
        settings.dumpSymbols = true;
        const CompilationResult result = compileSource(source, settings);

        ASSERT_TRUE(result.succeeded());
        EXPECT_TRUE(result.errors.empty());
        EXPECT_EQ(result.problemCount, 0u);
        EXPECT_EQ(result.declarationCount, 3u);
        EXPECT_EQ(occurrences(result.assembly, ".word"), 1u);
        EXPECT_NE(result.assembly.find("g_1: .word 14\n"), std::string::npos);
        EXPECT_EQ(occurrences(result.assembly, "    j main\n"), 1u);
        EXPECT_NE(result.assembly.find("\ntwice_0:\n"), std::string::npos);
        EXPECT_NE(result.assembly.find("\nmain:\n"), std::string::npos);
        EXPECT_NE(result.symbolDump.find("    x_3 : int (variable), offset=0\n"), std::string::npos);
        EXPECT_NE(result.symbolDump.find("    x_4 : int (variable), offset=4\n"), std::string::npos);
    }

    TEST(PipelineTest, StopsAtLexicalError)
    {
        const CompilationResult result = compileSource("fun int main() { return 1 $ 2; }\n");

        EXPECT_FALSE(result.succeeded());
        EXPECT_EQ(result.stage, CompilationStage::Lexing);
        ASSERT_EQ(result.errors.size(), 1u);
        EXPECT_EQ(result.errors.front().kind(), semantic::ErrorKind::Lex);
        EXPECT_EQ(result.problemCount, 1u);
        EXPECT_TRUE(result.assembly.empty());
    }

    TEST(PipelineTest, StopsAtSyntaxError)
    {
        const CompilationResult result = compileSource("fun int main() {\n    return 1\n}\n");

        EXPECT_EQ(result.stage, CompilationStage::Parsing);
        ASSERT_EQ(result.errors.size(), 1u);
        EXPECT_EQ(result.errors.front().kind(), semantic::ErrorKind::Parse);
        EXPECT_NE(result.errors.front().render().find("Expected ';' after return value, but got '}'."),
                  std::string::npos);
    }

    TEST(PipelineTest, MergesCheckingErrorsBySourceLine)
    {
        const std::string source = R"(fun int main() {
    int count = 1;
    int x = true + 1;
    print coutn;
    return 0;
}
print 3;
)";

        const CompilationResult result = compileSource(source);

        EXPECT_EQ(result.stage, CompilationStage::Checking);
        EXPECT_EQ(result.problemCount, 3u);
        ASSERT_EQ(result.errors.size(), 3u);
        EXPECT_EQ(result.errors[0].kind(), semantic::ErrorKind::Type);
        EXPECT_EQ(result.errors[0].startLine(), 3u);
        EXPECT_EQ(result.errors[1].kind(), semantic::ErrorKind::Name);
        EXPECT_NE(result.errors[1].render().find("Did you mean 'count'?"), std::string::npos);
        EXPECT_EQ(result.errors[2].kind(), semantic::ErrorKind::Scope);
        EXPECT_TRUE(result.assembly.empty());
    }

    TEST(PipelineTest, CountsEveryProblemInGroupedError)
    {
        const std::string source = "int g = 1 + seed() * seed();\nfun int seed() { return 3; }\nfun int main() { return g; }\n";
        const CompilationResult result = compileSource(source);

        ASSERT_FALSE(result.errors.empty());
        EXPECT_EQ(result.errors.front().problems().size(), 2u);
        EXPECT_EQ(result.problemCount, semantic::countProblems(result.errors));
    }

    TEST(PipelineTest, ReportsMissingEntryForCustomName)
    {
        CompilationSettings settings;
        settings.entryName = "start";
        const CompilationResult result = compileSource("fun int main() { return 0; }\n", settings);

        ASSERT_EQ(result.problemCount, 1u);
        EXPECT_EQ(result.errors.front().render(),
                  "Scope Error\n~~~~~~~~~~~~~~~~~~~\nNo start function found; program must have a start function as the "
                  "entry point.\n");
    }

    TEST(PipelineTest, CompilesWithCustomEntry)
    {
        CompilationSettings settings;
        settings.entryName = "start";
        const CompilationResult result = compileSource("fun int start() { print 1; return 0; }\n", settings);

        ASSERT_TRUE(result.succeeded());
        EXPECT_NE(result.assembly.find(".globl start\n"), std::string::npos);
        EXPECT_TRUE(result.symbolDump.empty());
    }

    TEST(PipelineTest, CompilesEntryNamedLikeGeneratedName)
    {
        CompilationSettings settings;
        settings.entryName = "a_0";
        const CompilationResult result = compileSource("int a = 1; fun int a_0() { print a; return 0; }\n", settings);

        ASSERT_TRUE(result.succeeded());
        EXPECT_TRUE(result.internalFailures.empty());
        EXPECT_NE(result.assembly.find("a_1: .word 1\n"), std::string::npos);
        EXPECT_NE(result.assembly.find("\na_0:\n"), std::string::npos);
    }

    TEST(PipelineTest, AnnotatesAssemblyWhenRequested)
    {
        const std::string source = "fun int main() {\n    print 1;\n    return 0;\n}\n";
        CompilationSettings settings;
        const CompilationResult plain = compileSource(source, settings);
        settings.annotate = true;
        const CompilationResult annotated = compileSource(source, settings);

        ASSERT_TRUE(annotated.succeeded());
        EXPECT_NE(annotated.assembly.find("    # print (line 2)\n"), std::string::npos);
        EXPECT_EQ(plain.assembly.find("    # print"), std::string::npos);
    }

    TEST(PipelineTest, NamesStages)
    {
        EXPECT_EQ(toString(CompilationStage::Lexing), "lexing");
        EXPECT_EQ(toString(CompilationStage::Complete), "complete");
    }
} // namespace
} // namespace badlang
