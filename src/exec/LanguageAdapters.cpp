//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/LanguageAdapters.cpp
// Purpose: Program templates and command lines for C++, Java, Rust,
//          JavaScript and PHP blocks.
// Key invariants: Marshalled declarations are placed where user code can
//                 both read and reassign them.
// Ownership/Lifetime: Stateless.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/LanguageAdapters.hpp"

#include <algorithm>

namespace fusion::exec
{

namespace
{

/// @brief Accumulates program text while counting lines.
class ProgramWriter
{
  public:
    void line(std::string_view text)
    {
        text_.append(text);
        text_.push_back('\n');
        ++lines_;
    }

    /// @brief Append the user code; returns the line it starts on.
    uint32_t user(std::string_view code)
    {
        const uint32_t first = lines_ + 1;
        std::string_view body = code;
        while (!body.empty() && body.back() == '\n')
            body.remove_suffix(1);
        text_.append(body);
        text_.push_back('\n');
        lines_ += static_cast<uint32_t>(std::count(body.begin(), body.end(), '\n')) + 1;
        return first;
    }

    std::string take()
    {
        return std::move(text_);
    }

  private:
    std::string text_;
    uint32_t lines_ = 0;
};

class CppLanguage final : public LanguageAdapter
{
  public:
    CppLanguage() : LanguageAdapter(makeMarshalAdapter(LanguageTag::Cpp)) {}

    LanguageTag language() const override
    {
        return LanguageTag::Cpp;
    }

    std::vector<ToolRequirement> requiredTools() const override
    {
        return {{"compiler", {"g++", "c++", "clang++"}}};
    }

    bool inlinePrintf() const override
    {
        return true;
    }

    std::string sourceFileName() const override
    {
        return "main.cpp";
    }

    Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const override
    {
        ProgramWriter w;
        for (const char *header : {"<cmath>", "<cstdio>", "<cstdlib>", "<cstddef>", "<iostream>", "<limits>",
                                   "<map>", "<string>", "<vector>"})
            w.line(std::string("#include ") + header);
        w.line("using namespace std;");
        w.line("int main() {");
        for (const auto &d : declarations)
            w.line(d);
        Synthesized s;
        s.firstUserLine = w.user(code);
        w.line("return 0;");
        w.line("}");
        s.text = w.take();
        return s;
    }

    CommandPlan plan(const std::map<std::string, std::string> &tools, const std::filesystem::path &dir) const override
    {
        const auto exe = (dir / "main").string();
        return {{{tools.at("compiler"), "-std=c++17", "-w", "-O1", (dir / "main.cpp").string(), "-o", exe}},
                {exe}};
    }
};

class JavaLanguage final : public LanguageAdapter
{
  public:
    JavaLanguage() : LanguageAdapter(makeMarshalAdapter(LanguageTag::Java)) {}

    LanguageTag language() const override
    {
        return LanguageTag::Java;
    }

    std::vector<ToolRequirement> requiredTools() const override
    {
        return {{"javac", {"javac"}}, {"java", {"java"}}};
    }

    std::string sourceFileName() const override
    {
        return "Main.java";
    }

    Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const override
    {
        ProgramWriter w;
        w.line("public class Main {");
        w.line("public static void main(String[] args) throws Exception {");
        for (const auto &d : declarations)
            w.line(d);
        Synthesized s;
        s.firstUserLine = w.user(code);
        w.line("}");
        w.line("}");
        s.text = w.take();
        return s;
    }

    CommandPlan plan(const std::map<std::string, std::string> &tools, const std::filesystem::path &dir) const override
    {
        return {{{tools.at("javac"), "-encoding", "UTF-8", "-nowarn", "-d", dir.string(),
                  (dir / "Main.java").string()}},
                {tools.at("java"), "-cp", dir.string(), "Main"}};
    }
};

class RustLanguage final : public LanguageAdapter
{
  public:
    RustLanguage() : LanguageAdapter(makeMarshalAdapter(LanguageTag::Rust)) {}

    LanguageTag language() const override
    {
        return LanguageTag::Rust;
    }

    std::vector<ToolRequirement> requiredTools() const override
    {
        return {{"rustc", {"rustc"}}};
    }

    std::string sourceFileName() const override
    {
        return "main.rs";
    }

    Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const override
    {
        ProgramWriter w;
        w.line("fn main() {");
        for (const auto &d : declarations)
            w.line(d);
        Synthesized s;
        s.firstUserLine = w.user(code);
        w.line("}");
        s.text = w.take();
        return s;
    }

    CommandPlan plan(const std::map<std::string, std::string> &tools, const std::filesystem::path &dir) const override
    {
        const auto exe = (dir / "main").string();
        return {{{tools.at("rustc"), "-A", "warnings", "-o", exe, (dir / "main.rs").string()}}, {exe}};
    }
};

class JsLanguage final : public LanguageAdapter
{
  public:
    JsLanguage() : LanguageAdapter(makeMarshalAdapter(LanguageTag::Js)) {}

    LanguageTag language() const override
    {
        return LanguageTag::Js;
    }

    std::vector<ToolRequirement> requiredTools() const override
    {
        return {{"node", {"node", "nodejs"}}};
    }

    std::string sourceFileName() const override
    {
        return "main.js";
    }

    Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const override
    {
        ProgramWriter w;
        w.line("\"use strict\";");
        for (const auto &d : declarations)
            w.line(d);
        Synthesized s;
        s.firstUserLine = w.user(code);
        s.text = w.take();
        return s;
    }

    CommandPlan plan(const std::map<std::string, std::string> &tools, const std::filesystem::path &dir) const override
    {
        return {{}, {tools.at("node"), (dir / "main.js").string()}};
    }
};

class PhpLanguage final : public LanguageAdapter
{
  public:
    PhpLanguage() : LanguageAdapter(makeMarshalAdapter(LanguageTag::Php)) {}

    LanguageTag language() const override
    {
        return LanguageTag::Php;
    }

    std::vector<ToolRequirement> requiredTools() const override
    {
        return {{"php", {"php"}}};
    }

    bool inlinePrintf() const override
    {
        return true;
    }

    std::string sourceFileName() const override
    {
        return "main.php";
    }

    Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const override
    {
        // Blocks may carry their own open tag; the wrapper provides one.
        std::string_view body = code;
        const auto first = body.find_first_not_of(" \t\n");
        if (first != std::string_view::npos && body.substr(first, 5) == "<?php")
            body = body.substr(first + 5);

        ProgramWriter w;
        w.line("<?php");
        for (const auto &d : declarations)
            w.line(d);
        Synthesized s;
        s.firstUserLine = w.user(body);
        s.text = w.take();
        return s;
    }

    CommandPlan plan(const std::map<std::string, std::string> &tools, const std::filesystem::path &dir) const override
    {
        return {{}, {tools.at("php"), "-f", (dir / "main.php").string()}};
    }
};

} // namespace

std::unique_ptr<LanguageAdapter> makeLanguageAdapter(LanguageTag language)
{
    switch (language)
    {
        case LanguageTag::Cpp:
            return std::make_unique<CppLanguage>();
        case LanguageTag::Java:
            return std::make_unique<JavaLanguage>();
        case LanguageTag::Rust:
            return std::make_unique<RustLanguage>();
        case LanguageTag::Js:
            return std::make_unique<JsLanguage>();
        case LanguageTag::Php:
            return std::make_unique<PhpLanguage>();
        case LanguageTag::Py:
            break;
    }
    return nullptr;
}

} // namespace fusion::exec
