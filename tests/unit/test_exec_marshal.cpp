// File: tests/unit/test_exec_marshal.cpp
// Purpose: Check how native values are declared in each subprocess language
//          and which environment names a block picks up.
// Key invariants: Only referenced names are declared; values without a
//                 faithful rendering raise MarshalError naming the variable.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/Marshal.cpp

#include "exec/Marshal.hpp"
#include "vm/Environment.hpp"
#include "vm/Value.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

using namespace fusion;
using exec::LanguageTag;
using exec::MarshalError;
using vm::Value;

namespace
{
std::string declare(LanguageTag lang, const std::string &name, const Value &v)
{
    return exec::makeMarshalAdapter(lang)->declare(name, v);
}

Value scores()
{
    Value d = Value::dict();
    d.asDict().set(Value::string("ada"), Value::integer(3));
    d.asDict().set(Value::string("bob"), Value::integer(5));
    return d;
}
} // namespace

TEST(Marshal, CppScalarsAndContainers)
{
    EXPECT_EQ(declare(LanguageTag::Cpp, "n", Value::integer(5)), "long long n = 5LL;");
    EXPECT_EQ(declare(LanguageTag::Cpp, "s", Value::string("a\"b")), "std::string s = std::string(\"a\\\"b\", 3);");
    EXPECT_EQ(declare(LanguageTag::Cpp, "ok", Value::boolean(true)), "bool ok = true;");
    EXPECT_EQ(declare(LanguageTag::Cpp, "v", Value::list({Value::integer(1), Value::real(2.5)})),
              "std::vector<double> v = {1.0, 2.5};");
    EXPECT_EQ(declare(LanguageTag::Cpp, "m", scores()),
              "std::map<std::string, long long> m = {{std::string(\"ada\", 3), 3LL}, {std::string(\"bob\", 3), 5LL}};");
    EXPECT_EQ(declare(LanguageTag::Cpp, "none", Value::none()), "std::nullptr_t none = nullptr;");
    EXPECT_EQ(declare(LanguageTag::Cpp, "lo", Value::integer(std::numeric_limits<int64_t>::min())),
              "long long lo = (-9223372036854775807LL - 1);");
}

TEST(Marshal, StaticTargetsRejectMixedContainers)
{
    const Value mixed = Value::list({Value::integer(1), Value::string("a")});
    for (auto lang : {LanguageTag::Cpp, LanguageTag::Java, LanguageTag::Rust})
    {
        try
        {
            declare(lang, "mixed", mixed);
            ADD_FAILURE() << "expected MarshalError";
        }
        catch (const MarshalError &e)
        {
            EXPECT_EQ(e.name(), "mixed");
        }
    }
    EXPECT_THROW(declare(LanguageTag::Cpp, "holes", Value::list({Value::none()})), MarshalError);
}

TEST(Marshal, JavaDeclarations)
{
    EXPECT_EQ(declare(LanguageTag::Java, "n", Value::integer(-2)), "long n = -2L;");
    EXPECT_EQ(declare(LanguageTag::Java, "xs", Value::list({Value::integer(1), Value::integer(2)})),
              "long[] xs = new long[]{1L, 2L};");
    EXPECT_EQ(declare(LanguageTag::Java, "m", scores()),
              "java.util.Map<String, Long> m = new java.util.LinkedHashMap<String, Long>() {{ put(\"ada\", 3L); "
              "put(\"bob\", 5L); }};");
    EXPECT_EQ(declare(LanguageTag::Java, "nothing", Value::none()), "Object nothing = null;");
    EXPECT_THROW(declare(LanguageTag::Java, "rows", Value::list({scores()})), MarshalError);
}

TEST(Marshal, RustDeclarations)
{
    EXPECT_EQ(declare(LanguageTag::Rust, "b", Value::boolean(false)), "let mut b: bool = false;");
    EXPECT_EQ(declare(LanguageTag::Rust, "x", Value::real(0.5)), "let mut x: f64 = 0.5_f64;");
    EXPECT_EQ(declare(LanguageTag::Rust, "words", Value::list({Value::string("hi")})),
              "let mut words: Vec<String> = vec![String::from(\"hi\")];");
    EXPECT_EQ(declare(LanguageTag::Rust, "empty", Value::list()), "let mut empty: Vec<i64> = vec![];");
}

TEST(Marshal, DynamicTargetsAcceptAnyJsonShape)
{
    const Value mixed = Value::list({Value::integer(1), Value::string("a"), Value::none()});
    EXPECT_EQ(declare(LanguageTag::Js, "v", mixed), "let v = [1, \"a\", null];");
    EXPECT_EQ(declare(LanguageTag::Php, "v", mixed), "$v = [1, \"a\", null];");
    EXPECT_EQ(declare(LanguageTag::Js, "m", scores()), "let m = {\"ada\": 3, \"bob\": 5};");
    EXPECT_EQ(declare(LanguageTag::Php, "m", scores()), "$m = [\"ada\" => 3, \"bob\" => 5];");
    EXPECT_EQ(declare(LanguageTag::Php, "s", Value::string("a$b")), "$s = \"a\\$b\";");
}

TEST(Marshal, NonStringKeysAndReservedNames)
{
    Value d = Value::dict();
    d.asDict().set(Value::integer(1), Value::string("one"));
    EXPECT_THROW(declare(LanguageTag::Js, "d", d), MarshalError);
    EXPECT_THROW(declare(LanguageTag::Cpp, "class", Value::integer(1)), MarshalError);
    EXPECT_THROW(declare(LanguageTag::Java, "int", Value::integer(1)), MarshalError);
}

TEST(Marshal, ReferencedIdentifiersSkipsMembersStringsAndComments)
{
    const auto js = exec::referencedIdentifiers("console.log(`${greeting}, ${user.name}`); // total", LanguageTag::Js);
    EXPECT_NE(std::find(js.begin(), js.end(), "console"), js.end());
    EXPECT_NE(std::find(js.begin(), js.end(), "greeting"), js.end());
    EXPECT_NE(std::find(js.begin(), js.end(), "user"), js.end());
    EXPECT_EQ(std::find(js.begin(), js.end(), "log"), js.end());
    EXPECT_EQ(std::find(js.begin(), js.end(), "name"), js.end());
    EXPECT_EQ(std::find(js.begin(), js.end(), "total"), js.end());

    const auto php = exec::referencedIdentifiers("echo \"hello $who\\n\";", LanguageTag::Php);
    EXPECT_NE(std::find(php.begin(), php.end(), "who"), php.end());

    const auto rust = exec::referencedIdentifiers("println!(\"{count:>4}\");", LanguageTag::Rust);
    EXPECT_NE(std::find(rust.begin(), rust.end(), "count"), rust.end());
}

TEST(Marshal, EnvironmentDeclaresOnlyReferencedVariables)
{
    vm::Environment env;
    env.assign("used", Value::integer(1));
    env.assign("unused", Value::integer(2));
    auto fn = std::make_shared<vm::FunctionObject>();
    fn->name = "helper";
    env.assign("helper", Value::function(fn));

    auto adapter = exec::makeMarshalAdapter(LanguageTag::Js);
    const auto decls = exec::marshalEnvironment(*adapter, "console.log(used);", env);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0], "let used = 1;");

    try
    {
        exec::marshalEnvironment(*adapter, "helper(used);", env);
        FAIL() << "expected MarshalError";
    }
    catch (const MarshalError &e)
    {
        EXPECT_EQ(e.name(), "helper");
    }
}
