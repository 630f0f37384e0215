// File: tests/unit/test_exec_printf.cpp
// Purpose: Check discovery and rewriting of printf calls whose arguments are
//          computed from native values.
// Key invariants: Only top-level calls with a literal format are rewritten;
//                 a call with a non-native argument is left untouched and an
//                 evaluation error propagates to the caller.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/Printf.cpp

#include "exec/Printf.hpp"
#include "vm/NativeError.hpp"
#include "vm/Value.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

using namespace fusion;
using exec::LanguageTag;
using vm::Value;

namespace
{
exec::PrintfEvaluator lookupIn(std::map<std::string, Value> values)
{
    return [values = std::move(values)](const std::string &expr) -> std::optional<Value> {
        auto it = values.find(expr);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    };
}
} // namespace

TEST(Printf, FindsTopLevelCalls)
{
    const std::string code = "printf(\"%d and %s\\n\", count + 1, name);";
    const auto calls = exec::findPrintfCalls(code, LanguageTag::Cpp);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].callee, "printf");
    EXPECT_EQ(calls[0].begin, 0u);
    EXPECT_EQ(calls[0].end, code.size() - 1);
    EXPECT_EQ(calls[0].format, "%d and %s\\n");
    ASSERT_EQ(calls[0].args.size(), 2u);
    EXPECT_EQ(calls[0].args[0], "count + 1");
    EXPECT_EQ(calls[0].args[1], "name");
}

TEST(Printf, IgnoresNestedCommentedAndLiteralOnlyCalls)
{
    EXPECT_TRUE(exec::findPrintfCalls("for (int i = 0; i < 3; ++i) { printf(\"%d\", i); }", LanguageTag::Cpp)
                    .empty());
    EXPECT_TRUE(exec::findPrintfCalls("// printf(\"%d\", x);\n", LanguageTag::Cpp).empty());
    EXPECT_TRUE(exec::findPrintfCalls("puts(\"printf(%d, x)\");", LanguageTag::Cpp).empty());
    EXPECT_TRUE(exec::findPrintfCalls("printf(\"plain\\n\");", LanguageTag::Cpp).empty());
    EXPECT_TRUE(exec::findPrintfCalls("logger.printf(\"%d\", x);", LanguageTag::Java).empty());
}

TEST(Printf, JavaCalleeIsRecognised)
{
    const auto calls = exec::findPrintfCalls("System.out.printf(\"%d%n\", total);", LanguageTag::Java);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].callee, "System.out.printf");
    EXPECT_EQ(calls[0].begin, 0u);
}

TEST(Printf, FormatsWithCConventions)
{
    const vm::ValueList args = {Value::real(3.14159), Value::integer(42), Value::string("x")};
    EXPECT_EQ(exec::formatPrintf("%5.2f|%ld|%s", args, LanguageTag::Cpp), " 3.14|42|x");
    EXPECT_EQ(exec::formatPrintf("%d%%%n", {Value::integer(7)}, LanguageTag::Java), "7%\n");
    EXPECT_EQ(exec::formatPrintf("%x", {Value::integer(255)}, LanguageTag::Php), "ff");
    EXPECT_THROW(exec::formatPrintf("%d", {Value::string("nope")}, LanguageTag::Cpp), exec::PrintfError);
    EXPECT_THROW(exec::formatPrintf("%p", {Value::integer(1)}, LanguageTag::Cpp), exec::PrintfError);
    EXPECT_THROW(exec::formatPrintf("%d %d", {Value::integer(1)}, LanguageTag::Cpp), exec::PrintfError);
}

TEST(Printf, UnescapeAndRequote)
{
    EXPECT_EQ(exec::unescapeLiteral("a\\tb\\n\\x41\\101\\\""), "a\tb\nAA\"");
    EXPECT_EQ(exec::quotePrintfLiteral("50%\n", LanguageTag::Cpp), "\"50%%\\n\"");
    EXPECT_EQ(exec::quotePrintfLiteral("$5", LanguageTag::Php), "\"\\$5\"");
    EXPECT_EQ(exec::quotePrintfLiteral(std::string(1, '\x01'), LanguageTag::Cpp), "\"\\001\"");
    EXPECT_EQ(exec::quotePrintfLiteral(std::string(1, '\x01'), LanguageTag::Js), "\"\\x01\"");
}

TEST(Printf, RewriteSingleCallProducesInlineText)
{
    auto rw = exec::rewritePrintf("printf(\"%d items\\n\", count);", LanguageTag::Cpp,
                                  lookupIn({{"count", Value::integer(7)}}));
    EXPECT_EQ(rw.rewritten, 1u);
    EXPECT_EQ(rw.code, "printf(\"7 items\\n\");");
    ASSERT_TRUE(rw.inlineText.has_value());
    EXPECT_EQ(*rw.inlineText, "7 items\n");
}

TEST(Printf, RewriteLeavesNonNativeArgumentsAlone)
{
    const std::string code = "printf(\"%s\\n\", std::string(\"x\").c_str());\nprintf(\"%s\\n\", who);";
    auto rw = exec::rewritePrintf(code, LanguageTag::Cpp, lookupIn({{"who", Value::string("Ada")}}));
    EXPECT_EQ(rw.rewritten, 1u);
    EXPECT_EQ(rw.code, "printf(\"%s\\n\", std::string(\"x\").c_str());\nprintf(\"Ada\\n\");");
    EXPECT_FALSE(rw.inlineText.has_value());
}

TEST(Printf, EvaluationErrorPropagates)
{
    const exec::PrintfEvaluator unbound = [](const std::string &expr) -> std::optional<Value> {
        throw vm::NativeTrap(vm::NativeError{vm::NativeErrorKind::NameError, "name '" + expr + "' is not defined", 3});
    };
    try
    {
        exec::rewritePrintf("printf(\"%s\\n\", $x);", LanguageTag::Php, unbound);
        FAIL() << "expected a NameError";
    }
    catch (const vm::NativeTrap &trap)
    {
        EXPECT_EQ(trap.error().kind, vm::NativeErrorKind::NameError);
        EXPECT_EQ(trap.error().message, "name 'x' is not defined");
    }
}

TEST(Printf, FormatLiteralIsMatchedAgainstArgumentText)
{
    const std::string code = "$greeting = \"hello\";\n"
                             "echo \"a \\\"quoted\\\" word\";\n"
                             "printf(\"[%s] \\\"%d\\\"\\n\", $greeting, 4);";
    const auto calls = exec::findPrintfCalls(code, LanguageTag::Php);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].format, "[%s] \\\"%d\\\"\\n");
    ASSERT_EQ(calls[0].args.size(), 2u);
    EXPECT_EQ(calls[0].args[0], "$greeting");

    EXPECT_TRUE(exec::findPrintfCalls("printf(\"%d\" \"%d\", a, b);", LanguageTag::Cpp).empty());
}

TEST(Printf, PhpSigilsAreStrippedBeforeEvaluation)
{
    auto rw = exec::rewritePrintf("printf(\"%s!\", $name);", LanguageTag::Php,
                                  lookupIn({{"name", Value::string("Bo")}}));
    ASSERT_TRUE(rw.inlineText.has_value());
    EXPECT_EQ(*rw.inlineText, "Bo!");
    EXPECT_EQ(rw.code, "printf(\"Bo!\");");
}
