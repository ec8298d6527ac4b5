#include <gtest/gtest.h>

#include "command_line.hpp"

#include <iterator>

namespace
{
    TEST(CommandLineParserTest, UsesDefaultsForSingleInput)
    {
        const char* argv[] = {"badc", "program.bl"};

        badlang::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->inputPath, "program.bl");
        EXPECT_TRUE(options->outputPath.empty());
        EXPECT_EQ(options->entryName, "main");
        EXPECT_FALSE(options->dumpSymbols);
        EXPECT_FALSE(options->annotate);
        EXPECT_FALSE(options->quiet);
    }

    TEST(CommandLineParserTest, ParsesOutputSeparateArgument)
    {
        const char* argv[] = {"badc", "-o", "out.s", "program.bl"};

        badlang::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->outputPath, "out.s");
        EXPECT_EQ(options->inputPath, "program.bl");
    }

    TEST(CommandLineParserTest, ParsesOutputAttachedForm)
    {
        const char* argv[] = {"badc", "program.bl", "-obuild/out.s"};

        badlang::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->outputPath, "build/out.s");
    }

    TEST(CommandLineParserTest, ParsesFlagsAndEntry)
    {
        const char* argv[] = {"badc", "--dump-symbols", "--annotate", "--quiet", "--entry=start", "program.bl"};

        badlang::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->dumpSymbols);
        EXPECT_TRUE(options->annotate);
        EXPECT_TRUE(options->quiet);
        EXPECT_EQ(options->entryName, "start");
    }

    TEST(CommandLineParserTest, HelpAndVersionReturnEarly)
    {
        const char* helpArgv[] = {"badc", "--help", "--bogus"};
        const char* versionArgv[] = {"badc", "--version"};

        badlang::CommandLineParser parser;
        auto help = parser.parse(static_cast<int>(std::size(helpArgv)), const_cast<char**>(helpArgv));
        ASSERT_TRUE(help.has_value());
        EXPECT_TRUE(help->showHelp);

        auto version = parser.parse(static_cast<int>(std::size(versionArgv)), const_cast<char**>(versionArgv));
        ASSERT_TRUE(version.has_value());
        EXPECT_TRUE(version->showVersion);
    }

    TEST(CommandLineParserTest, RejectsInvalidArguments)
    {
        const char* missingOutput[] = {"badc", "program.bl", "-o"};
        const char* unknown[] = {"badc", "--emit=obj", "program.bl"};
        const char* noInput[] = {"badc", "--quiet"};
        const char* twoInputs[] = {"badc", "a.bl", "b.bl"};
        const char* emptyEntry[] = {"badc", "--entry=", "a.bl"};

        badlang::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(missingOutput)), const_cast<char**>(missingOutput)));
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(unknown)), const_cast<char**>(unknown)));
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(noInput)), const_cast<char**>(noInput)));
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(twoInputs)), const_cast<char**>(twoInputs)));
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(emptyEntry)), const_cast<char**>(emptyEntry)));
    }
}
