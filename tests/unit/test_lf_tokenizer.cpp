// File: tests/unit/test_lf_tokenizer.cpp
// Purpose: Cover line classification, directive handling and block assembly
//          for the .lf source format.
// Key invariants: Consecutive same-tag lines merge only while nesting is open
//                 or the continuation is indented deeper than the block start.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/frontends/lf/Tokenizer.cpp, src/frontends/lf/BlockAssembler.cpp,
//        src/frontends/lf/Directives.cpp

#include "frontends/lf/BlockAssembler.hpp"
#include "frontends/lf/Directives.hpp"
#include "frontends/lf/Tokenizer.hpp"
#include "support/diagnostics.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fusion::frontends::lf;

namespace
{
std::vector<CodeBlock> blocksOf(const std::string &source)
{
    auto lines = tokenize(source);
    EXPECT_TRUE(lines.hasValue());
    if (!lines)
        return {};
    return assembleBlocks(lines.value());
}
} // namespace

TEST(LfTokenizer, ClassifiesEveryLineKind)
{
    const std::string src = "#name \"Demo\"\n"
                            "\n"
                            "// a comment\n"
                            "py.x = 1\n"
                            "cpp.  int y = 2;\n";
    auto lines = tokenize(src, 7);
    ASSERT_TRUE(lines.hasValue());
    const auto &v = lines.value();
    ASSERT_EQ(v.size(), 5u);

    EXPECT_EQ(v[0].kind, LineKind::Directive);
    EXPECT_EQ(v[0].name, "name");
    EXPECT_EQ(v[0].value, "Demo");
    EXPECT_EQ(v[1].kind, LineKind::Blank);
    EXPECT_EQ(v[2].kind, LineKind::Comment);

    EXPECT_EQ(v[3].kind, LineKind::Code);
    EXPECT_EQ(v[3].tag, LanguageTag::Py);
    EXPECT_EQ(v[3].code, "x = 1");
    EXPECT_EQ(v[3].line, 4u);

    EXPECT_EQ(v[4].tag, LanguageTag::Cpp);
    EXPECT_EQ(v[4].indent, 2u);
    EXPECT_EQ(v[4].code, "int y = 2;");
}

TEST(LfTokenizer, DirectiveValueKeepsEscapedQuotes)
{
    auto lines = tokenize("#description \"say \\\"hi\\\"\"\n");
    ASSERT_TRUE(lines.hasValue());
    EXPECT_EQ(lines.value()[0].value, "say \"hi\"");
}

TEST(LfTokenizer, BlockCommentSpansLines)
{
    auto lines = tokenize("/* first\nstill comment */\npy.x = 1\n");
    ASSERT_TRUE(lines.hasValue());
    EXPECT_EQ(lines.value()[0].kind, LineKind::Comment);
    EXPECT_EQ(lines.value()[1].kind, LineKind::Comment);
    EXPECT_EQ(lines.value()[2].kind, LineKind::Code);
}

TEST(LfTokenizer, CodeAfterClosingCommentIsKept)
{
    const auto blocks = blocksOf("/*\n"
                                 "x\n"
                                 "*/ py.y = 5\n"
                                 "/* a */ /* b */ py.print(y)\n"
                                 "   /* only a comment */\n"
                                 "py.z = 1\n");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].line, 3u);
    EXPECT_EQ(blocks[0].content, "y = 5");
    EXPECT_EQ(blocks[1].line, 4u);
    EXPECT_EQ(blocks[1].content, "print(y)");
    EXPECT_EQ(blocks[2].line, 6u);

    auto lines = tokenize("/* a */ py.x = 1\n/* open\n*/\n");
    ASSERT_TRUE(lines.hasValue());
    EXPECT_EQ(lines.value()[0].kind, LineKind::Code);
    EXPECT_EQ(lines.value()[0].code, "x = 1");
    EXPECT_EQ(lines.value()[1].kind, LineKind::Comment);
    EXPECT_EQ(lines.value()[2].kind, LineKind::Comment);

    auto unterminated = tokenize("py.a = 1\n/* a */ /* b\n");
    ASSERT_FALSE(unterminated.hasValue());
    EXPECT_EQ(unterminated.error().loc.line, 2u);
}

TEST(LfTokenizer, UnknownTagIsRejected)
{
    auto lines = tokenize("py.x = 1\ncobol.DISPLAY X\n");
    ASSERT_FALSE(lines.hasValue());
    EXPECT_EQ(lines.error().code, "UnknownLanguageError");
    EXPECT_EQ(lines.error().loc.line, 2u);
    EXPECT_NE(lines.error().message.find("cobol"), std::string::npos);
}

TEST(LfTokenizer, MalformedLinesAreSyntaxErrors)
{
    auto noTag = tokenize("print('hello')\n");
    ASSERT_FALSE(noTag.hasValue());
    EXPECT_EQ(noTag.error().code, "SyntaxError");

    auto unquoted = tokenize("#name Demo\n");
    ASSERT_FALSE(unquoted.hasValue());
    EXPECT_EQ(unquoted.error().code, "SyntaxError");

    auto open = tokenize("/* never closed\npy.x = 1\n");
    ASSERT_FALSE(open.hasValue());
    EXPECT_EQ(open.error().code, "SyntaxError");
    EXPECT_EQ(open.error().loc.line, 1u);
}

TEST(LfTokenizer, SplitLinesAcceptsMixedEndings)
{
    const auto lines = splitLines("a\r\nb\rc\nd");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
    EXPECT_EQ(lines[3], "d");
}

TEST(LfBlockAssembler, IndentedSuiteJoinsItsHeader)
{
    const auto blocks = blocksOf("py.def f(x):\n"
                                 "py.    return x * 2\n"
                                 "py.print(f(3))\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].line, 1u);
    EXPECT_EQ(blocks[0].content, "def f(x):\n    return x * 2");
    EXPECT_EQ(blocks[0].fragments.size(), 2u);
    EXPECT_EQ(blocks[1].line, 3u);
    EXPECT_EQ(blocks[1].content, "print(f(3))");
}

TEST(LfBlockAssembler, ClauseKeywordContinuesCompoundStatement)
{
    const auto blocks = blocksOf("py.if x > 1:\n"
                                 "py.    y = 1\n"
                                 "py.else:\n"
                                 "py.    y = 2\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].content, "if x > 1:\n    y = 1\nelse:\n    y = 2");
}

TEST(LfBlockAssembler, OpenBracesKeepBraceBlocksTogether)
{
    const auto blocks = blocksOf("cpp.for (int i = 0; i < 3; ++i) {\n"
                                 "cpp.printf(\"%d\\n\", i);\n"
                                 "cpp.}\n"
                                 "cpp.int z = 0;\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].tag, LanguageTag::Cpp);
    EXPECT_EQ(blocks[0].content, "for (int i = 0; i < 3; ++i) {\nprintf(\"%d\\n\", i);\n}");
    EXPECT_EQ(blocks[1].content, "int z = 0;");
}

TEST(LfBlockAssembler, TagChangeAndBlankLinesSplitBlocks)
{
    const auto blocks = blocksOf("py.x = [1,\n"
                                 "py.     2]\n"
                                 "js.console.log(1);\n"
                                 "\n"
                                 "js.console.log(2);\n");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].tag, LanguageTag::Py);
    EXPECT_EQ(blocks[1].tag, LanguageTag::Js);
    EXPECT_EQ(blocks[2].line, 5u);
}

TEST(LfDirectives, LegacyImportIsRenamedWithNote)
{
    auto lines = tokenize("#python_import \"math\"\n#color \"blue\"\n");
    ASSERT_TRUE(lines.hasValue());

    fusion::support::DiagnosticEngine diags;
    DirectiveProcessor proc(diags, 1);
    for (const auto &line : lines.value())
        ASSERT_TRUE(proc.add(line).hasValue());

    EXPECT_EQ(proc.count(), 2u);
    EXPECT_EQ(diags.warningCount(), 1u);
    auto table = proc.take();
    ASSERT_EQ(table.count("native_import"), 1u);
    EXPECT_EQ(table["native_import"][0].value, "math");
    EXPECT_EQ(table.count("color"), 1u);
}

TEST(LfDirectives, InvalidModulePathIsSyntaxError)
{
    auto lines = tokenize("#native_import \"os; rm\"\n");
    ASSERT_TRUE(lines.hasValue());

    fusion::support::DiagnosticEngine diags;
    DirectiveProcessor proc(diags, 1);
    auto ok = proc.add(lines.value()[0]);
    ASSERT_FALSE(ok.hasValue());
    EXPECT_EQ(ok.error().code, "SyntaxError");
    EXPECT_TRUE(isValidModulePath("os.path"));
    EXPECT_FALSE(isValidModulePath("9lives"));
}
