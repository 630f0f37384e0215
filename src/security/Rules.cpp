//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Rules.cpp
// Purpose: Built-in rule catalogue and rule lookup.
// Key invariants: Patterns are ECMAScript regexes compiled once when added.
// Ownership/Lifetime: See Rules.hpp.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#include "security/Rules.hpp"

#include <algorithm>
#include <array>

namespace fusion::security
{

std::string_view toString(Capability c)
{
    switch (c)
    {
        case Capability::ProcessSpawn:
            return "process-spawn";
        case Capability::DynamicEval:
            return "dynamic-eval";
        case Capability::FileWrite:
            return "file-write";
        case Capability::FilesystemDestroy:
            return "fs-destroy";
        case Capability::Network:
            return "network";
        case Capability::Deserialize:
            return "deserialize";
        case Capability::NativeMemory:
            return "native-memory";
        case Capability::RestrictedImport:
            return "restricted-import";
        case Capability::ParseError:
            return "parse-error";
    }
    return "?";
}

void RuleSet::addPattern(std::string id,
                         LanguageTag language,
                         Capability capability,
                         Severity severity,
                         std::string pattern,
                         std::string message)
{
    Rule r;
    r.id = std::move(id);
    r.kind = RuleKind::Pattern;
    r.language = language;
    r.capability = capability;
    r.severity = severity;
    r.message = std::move(message);
    r.regex = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript | std::regex::optimize);
    r.pattern = std::move(pattern);
    rules_.push_back(std::move(r));
}

void RuleSet::addRule(Rule rule)
{
    rules_.push_back(std::move(rule));
}

bool RuleSet::override(std::string_view id, std::optional<Severity> severity)
{
    auto it = std::find_if(rules_.begin(), rules_.end(), [id](const Rule &r) { return r.id == id; });
    if (it == rules_.end())
        return false;
    if (severity)
    {
        it->severity = *severity;
        it->enabled = true;
    }
    else
    {
        it->enabled = false;
    }
    return true;
}

const Rule *RuleSet::find(std::string_view id) const
{
    for (const auto &r : rules_)
    {
        if (r.id == id)
            return &r;
    }
    return nullptr;
}

std::vector<const Rule *> RuleSet::patternRules(LanguageTag language) const
{
    std::vector<const Rule *> out;
    for (const auto &r : rules_)
    {
        if (r.enabled && r.kind == RuleKind::Pattern && r.language == language)
            out.push_back(&r);
    }
    return out;
}

const Rule *RuleSet::structuralRule(Capability capability) const
{
    for (const auto &r : rules_)
    {
        if (r.enabled && r.kind == RuleKind::Structural && r.capability == capability)
            return &r;
    }
    return nullptr;
}

const Rule *RuleSet::directiveRule() const
{
    for (const auto &r : rules_)
    {
        if (r.enabled && r.kind == RuleKind::Directive)
            return &r;
    }
    return nullptr;
}

namespace
{

void addStructural(RuleSet &set, std::string id, Capability c, Severity s, std::string message)
{
    Rule r;
    r.id = std::move(id);
    r.kind = RuleKind::Structural;
    r.language = LanguageTag::Py;
    r.capability = c;
    r.severity = s;
    r.message = std::move(message);
    set.addRule(std::move(r));
}

void addNativePatterns(RuleSet &set)
{
    constexpr auto Py = LanguageTag::Py;
    set.addPattern("py.os-exec", Py, Capability::ProcessSpawn, Severity::High,
                   R"re(\bos\s*\.\s*(system|popen|exec\w*|spawn\w*|fork\w*)\s*\()re", "process-spawning call");
    set.addPattern("py.subprocess", Py, Capability::ProcessSpawn, Severity::High, R"re(\bsubprocess\b)re",
                   "process-spawning module");
    set.addPattern("py.eval", Py, Capability::DynamicEval, Severity::High, R"re(\b(eval|exec|compile)\s*\()re",
                   "dynamic code evaluation");
    set.addPattern("py.dunder-import", Py, Capability::DynamicEval, Severity::High, R"re(\b__import__\b)re",
                   "dynamic import");
    set.addPattern("py.importlib", Py, Capability::DynamicEval, Severity::High, R"re(\bimportlib\b)re",
                   "dynamic import");
    set.addPattern("py.file-write", Py, Capability::FileWrite, Severity::Medium,
                   R"re(\bopen\s*\([^)]*['"][rb]*[wax+][a-z+]*['"])re", "arbitrary file write");
    set.addPattern("py.fs-destroy", Py, Capability::FilesystemDestroy, Severity::Critical,
                   R"re(\b(shutil\s*\.\s*rmtree|os\s*\.\s*(remove|unlink|rmdir|removedirs))\s*\()re",
                   "filesystem destruction");
    set.addPattern("py.network", Py, Capability::Network, Severity::Medium,
                   R"re(\b(socket|urllib|requests|httplib|http\.client|ftplib|smtplib|xmlrpc)\b)re",
                   "network access");
    set.addPattern("py.deserialize", Py, Capability::Deserialize, Severity::Medium,
                   R"re(\b(pickle|cPickle|shelve|marshal)\b)re", "unsafe deserialisation");
    set.addPattern("py.ctypes", Py, Capability::NativeMemory, Severity::High, R"re(\b(ctypes|cffi)\b)re",
                   "native memory access");
    set.addPattern("py.sys", Py, Capability::RestrictedImport, Severity::Low, R"re(\bsys\s*\.)re",
                   "interpreter internals access");
}

void addNativeStructural(RuleSet &set)
{
    addStructural(set, "py.ast.spawn", Capability::ProcessSpawn, Severity::High, "process-spawning call");
    addStructural(set, "py.ast.eval", Capability::DynamicEval, Severity::High, "dynamic code evaluation");
    addStructural(set, "py.ast.file-write", Capability::FileWrite, Severity::Medium, "arbitrary file write");
    addStructural(set, "py.ast.fs-destroy", Capability::FilesystemDestroy, Severity::Critical,
                  "filesystem destruction");
    addStructural(set, "py.ast.network", Capability::Network, Severity::Medium, "network access");
    addStructural(set, "py.ast.deserialize", Capability::Deserialize, Severity::Medium, "unsafe deserialisation");
    addStructural(set, "py.ast.native-memory", Capability::NativeMemory, Severity::High, "native memory access");
    addStructural(set, "py.ast.import", Capability::RestrictedImport, Severity::High,
                  "import of a restricted module");
    addStructural(set, "py.parse-error", Capability::ParseError, Severity::Medium,
                  "native block does not parse; structural analysis skipped");
}

void addJsPatterns(RuleSet &set)
{
    constexpr auto Js = LanguageTag::Js;
    set.addPattern("js.child-process", Js, Capability::ProcessSpawn, Severity::High,
                   R"re(require\s*\(\s*['"](node:)?child_process['"]\s*\))re", "process-spawning module");
    set.addPattern("js.eval", Js, Capability::DynamicEval, Severity::High, R"re(\beval\s*\()re",
                   "dynamic code evaluation");
    set.addPattern("js.function-ctor", Js, Capability::DynamicEval, Severity::High, R"re(\bFunction\s*\()re",
                   "dynamic code evaluation");
    set.addPattern("js.dynamic-import", Js, Capability::DynamicEval, Severity::Medium, R"re(\bimport\s*\()re",
                   "dynamic import");
    set.addPattern("js.fs", Js, Capability::FileWrite, Severity::Medium,
                   R"re(require\s*\(\s*['"](node:)?fs(/promises)?['"]\s*\))re", "filesystem module");
    set.addPattern("js.network", Js, Capability::Network, Severity::Medium,
                   R"re(require\s*\(\s*['"](node:)?(http|https|net|dgram|tls)['"]\s*\))re", "network access");
    set.addPattern("js.workers", Js, Capability::ProcessSpawn, Severity::Medium,
                   R"re(require\s*\(\s*['"](node:)?(cluster|worker_threads)['"]\s*\))re", "worker creation");
}

void addCppPatterns(RuleSet &set)
{
    constexpr auto Cpp = LanguageTag::Cpp;
    set.addPattern("cpp.system", Cpp, Capability::ProcessSpawn, Severity::High, R"re(\bsystem\s*\()re",
                   "process-spawning call");
    set.addPattern("cpp.exec", Cpp, Capability::ProcessSpawn, Severity::High,
                   R"re(\b(exec[lv]p?e?|posix_spawnp?|fork)\s*\()re", "process-spawning call");
    set.addPattern("cpp.popen", Cpp, Capability::ProcessSpawn, Severity::High, R"re(\b_?popen\s*\()re",
                   "process-spawning call");
    set.addPattern("cpp.win-spawn", Cpp, Capability::ProcessSpawn, Severity::High,
                   R"re(\b(WinExec|CreateProcess\w*|ShellExecute\w*)\b)re", "process-spawning call");
    set.addPattern("cpp.fs-destroy", Cpp, Capability::FilesystemDestroy, Severity::Critical,
                   R"re(\bremove_all\s*\(|\bunlink\s*\(|\brmdir\s*\()re", "filesystem destruction");
    set.addPattern("cpp.socket", Cpp, Capability::Network, Severity::Medium,
                   R"re(#\s*include\s*<(sys/socket\.h|netinet/in\.h|winsock2?\.h)>)re", "network access");
    set.addPattern("cpp.asm", Cpp, Capability::NativeMemory, Severity::Medium, R"re(\b(asm|__asm__)\b)re",
                   "inline assembly");
}

void addJavaPatterns(RuleSet &set)
{
    constexpr auto Java = LanguageTag::Java;
    set.addPattern("java.runtime-exec", Java, Capability::ProcessSpawn, Severity::High,
                   R"re(\bRuntime\s*\.\s*getRuntime\s*\(\s*\)\s*\.\s*exec\b)re", "process-spawning call");
    set.addPattern("java.process-builder", Java, Capability::ProcessSpawn, Severity::High,
                   R"re(\bProcessBuilder\b)re", "process-spawning call");
    set.addPattern("java.reflection", Java, Capability::DynamicEval, Severity::Medium,
                   R"re(\bjava\.lang\.reflect\b|\bClass\s*\.\s*forName\s*\()re", "reflective access");
    set.addPattern("java.file-delete", Java, Capability::FilesystemDestroy, Severity::Critical,
                   R"re(\bFiles\s*\.\s*delete(IfExists)?\s*\()re", "filesystem destruction");
    set.addPattern("java.file-write", Java, Capability::FileWrite, Severity::Medium,
                   R"re(\b(FileOutputStream|FileWriter|Files\s*\.\s*write\w*)\b)re", "arbitrary file write");
    set.addPattern("java.network", Java, Capability::Network, Severity::Medium,
                   R"re(\bjava\.net\b|\bnew\s+(Server)?Socket\s*\()re", "network access");
    set.addPattern("java.deserialize", Java, Capability::Deserialize, Severity::Medium,
                   R"re(\bObjectInputStream\b)re", "unsafe deserialisation");
}

void addPhpPatterns(RuleSet &set)
{
    constexpr auto Php = LanguageTag::Php;
    set.addPattern("php.exec", Php, Capability::ProcessSpawn, Severity::High,
                   R"re(\b(exec|shell_exec|system|passthru|proc_open|popen|pcntl_exec)\s*\()re",
                   "process-spawning call");
    set.addPattern("php.backtick", Php, Capability::ProcessSpawn, Severity::High, R"re(`[^`]*`)re",
                   "shell execution operator");
    set.addPattern("php.eval", Php, Capability::DynamicEval, Severity::High,
                   R"re(\b(eval|assert|create_function)\s*\()re", "dynamic code evaluation");
    set.addPattern("php.fs-destroy", Php, Capability::FilesystemDestroy, Severity::Critical,
                   R"re(\b(unlink|rmdir)\s*\()re", "filesystem destruction");
    set.addPattern("php.file-write", Php, Capability::FileWrite, Severity::Medium,
                   R"re(\b(file_put_contents|fwrite|fputs)\s*\()re", "arbitrary file write");
    set.addPattern("php.network", Php, Capability::Network, Severity::Medium,
                   R"re(\b(fsockopen|curl_exec|stream_socket_client)\s*\()re", "network access");
    set.addPattern("php.unserialize", Php, Capability::Deserialize, Severity::Medium, R"re(\bunserialize\s*\()re",
                   "unsafe deserialisation");
}

void addRustPatterns(RuleSet &set)
{
    constexpr auto Rust = LanguageTag::Rust;
    set.addPattern("rust.command", Rust, Capability::ProcessSpawn, Severity::High,
                   R"re(\bprocess\s*::\s*Command\b|\bCommand\s*::\s*new\s*\()re", "process-spawning call");
    set.addPattern("rust.fs-destroy", Rust, Capability::FilesystemDestroy, Severity::Critical,
                   R"re(\bremove_dir_all\b|\bfs\s*::\s*remove_file\b)re", "filesystem destruction");
    set.addPattern("rust.file-write", Rust, Capability::FileWrite, Severity::Medium,
                   R"re(\bfs\s*::\s*write\b|\bFile\s*::\s*create\b)re", "arbitrary file write");
    set.addPattern("rust.network", Rust, Capability::Network, Severity::Medium,
                   R"re(\bstd\s*::\s*net\b|\b(TcpStream|TcpListener|UdpSocket)\b)re", "network access");
    set.addPattern("rust.unsafe", Rust, Capability::NativeMemory, Severity::Medium, R"re(\bunsafe\b)re",
                   "unsafe block");
}

} // namespace

RuleSet RuleSet::defaults()
{
    RuleSet set;
    addNativePatterns(set);
    addNativeStructural(set);
    addJsPatterns(set);
    addCppPatterns(set);
    addJavaPatterns(set);
    addPhpPatterns(set);
    addRustPatterns(set);

    Rule directive;
    directive.id = "directive.native-import";
    directive.kind = RuleKind::Directive;
    directive.capability = Capability::RestrictedImport;
    directive.severity = Severity::High;
    directive.message = "native_import of a restricted module";
    set.addRule(std::move(directive));
    return set;
}

bool isRestrictedModule(std::string_view dottedName)
{
    static constexpr std::array<std::string_view, 24> kRestricted = {
        "os",     "subprocess", "sys",    "shutil",  "socket",   "urllib",   "requests", "http",
        "ftplib", "smtplib",    "pickle", "shelve",  "marshal",  "ctypes",   "cffi",     "importlib",
        "pty",    "signal",     "multiprocessing", "threading", "builtins", "io", "tempfile", "webbrowser",
    };
    const auto root = dottedName.substr(0, dottedName.find('.'));
    return std::find(kRestricted.begin(), kRestricted.end(), root) != kRestricted.end();
}

} // namespace fusion::security
