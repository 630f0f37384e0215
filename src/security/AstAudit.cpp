//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/AstAudit.cpp
// Purpose: Alias table maintenance and capability matching for the native
//          structural audit.
// Key invariants: A name rebound to something untracked loses its alias.
// Ownership/Lifetime: See AstAudit.hpp.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#include "security/AstAudit.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace fusion::security
{

using namespace frontends::py;

namespace
{

struct CapabilityEntry
{
    std::string_view pattern; ///< Exact name, or prefix when ending in '*'.
    Capability capability;
};

constexpr std::array<CapabilityEntry, 51> kCapabilities = {{
    {"os.system", Capability::ProcessSpawn},
    {"os.popen", Capability::ProcessSpawn},
    {"os.exec*", Capability::ProcessSpawn},
    {"os.spawn*", Capability::ProcessSpawn},
    {"os.fork*", Capability::ProcessSpawn},
    {"os.posix_spawn*", Capability::ProcessSpawn},
    {"os.kill", Capability::ProcessSpawn},
    {"subprocess.*", Capability::ProcessSpawn},
    {"pty.spawn", Capability::ProcessSpawn},
    {"multiprocessing.*", Capability::ProcessSpawn},
    {"eval", Capability::DynamicEval},
    {"exec", Capability::DynamicEval},
    {"compile", Capability::DynamicEval},
    {"builtins.eval", Capability::DynamicEval},
    {"builtins.exec", Capability::DynamicEval},
    {"builtins.compile", Capability::DynamicEval},
    {"os.write", Capability::FileWrite},
    {"os.rename", Capability::FileWrite},
    {"os.replace", Capability::FileWrite},
    {"os.chmod", Capability::FileWrite},
    {"os.chown", Capability::FileWrite},
    {"os.mkdir", Capability::FileWrite},
    {"os.makedirs", Capability::FileWrite},
    {"shutil.copy*", Capability::FileWrite},
    {"shutil.move", Capability::FileWrite},
    {"tempfile.*", Capability::FileWrite},
    {"os.remove", Capability::FilesystemDestroy},
    {"os.unlink", Capability::FilesystemDestroy},
    {"os.rmdir", Capability::FilesystemDestroy},
    {"os.removedirs", Capability::FilesystemDestroy},
    {"os.truncate", Capability::FilesystemDestroy},
    {"shutil.rmtree", Capability::FilesystemDestroy},
    {"socket.*", Capability::Network},
    {"urllib.*", Capability::Network},
    {"requests.*", Capability::Network},
    {"http.*", Capability::Network},
    {"ftplib.*", Capability::Network},
    {"smtplib.*", Capability::Network},
    {"xmlrpc.*", Capability::Network},
    {"webbrowser.*", Capability::Network},
    {"pickle.load*", Capability::Deserialize},
    {"pickle.Unpickler", Capability::Deserialize},
    {"marshal.load*", Capability::Deserialize},
    {"shelve.open", Capability::Deserialize},
    {"yaml.load", Capability::Deserialize},
    {"yaml.unsafe_load", Capability::Deserialize},
    {"ctypes.*", Capability::NativeMemory},
    {"cffi.*", Capability::NativeMemory},
    {"os.putenv", Capability::ProcessSpawn},
    {"sys.settrace", Capability::NativeMemory},
    {"sys.setprofile", Capability::NativeMemory},
}};
static_assert(std::none_of(kCapabilities.begin(),
                           kCapabilities.end(),
                           [](const CapabilityEntry &e) { return e.pattern.empty(); }),
              "every capability entry needs a pattern");

bool matchesPattern(std::string_view pattern, std::string_view symbol)
{
    if (!pattern.empty() && pattern.back() == '*')
    {
        const auto prefix = pattern.substr(0, pattern.size() - 1);
        return symbol.size() > prefix.size() && symbol.substr(0, prefix.size()) == prefix;
    }
    return pattern == symbol;
}

const StringLiteralExpr *stringArg(const CallExpr &call, size_t index, std::string_view keyword)
{
    const Expr *arg = nullptr;
    if (index < call.args.size())
        arg = call.args[index].get();
    for (const auto &kw : call.kwargs)
    {
        if (kw.name == keyword)
            arg = kw.value.get();
    }
    if (arg && arg->kind == ExprKind::StringLiteral)
        return static_cast<const StringLiteralExpr *>(arg);
    return nullptr;
}

bool hasArg(const CallExpr &call, size_t index, std::string_view keyword)
{
    if (index < call.args.size())
        return true;
    return std::any_of(call.kwargs.begin(), call.kwargs.end(), [&](const KeywordArg &kw) { return kw.name == keyword; });
}

} // namespace

std::optional<Capability> capabilityOf(std::string_view symbol)
{
    for (const auto &entry : kCapabilities)
    {
        if (matchesPattern(entry.pattern, symbol))
            return entry.capability;
    }
    return std::nullopt;
}

class AstAudit::Walker : public AstVisitor
{
  public:
    explicit Walker(AstAudit &audit) : audit_(audit) {}

    std::vector<StructuralHit> hits;

    void visitStmt(const Stmt &stmt) override
    {
        switch (stmt.kind)
        {
            case StmtKind::Import:
                onImport(static_cast<const ImportStmt &>(stmt));
                break;
            case StmtKind::ImportFrom:
                onImportFrom(static_cast<const ImportFromStmt &>(stmt));
                break;
            case StmtKind::Assign:
                onAssign(static_cast<const AssignStmt &>(stmt));
                break;
            case StmtKind::FunctionDef:
                audit_.aliases_.erase(static_cast<const FunctionDefStmt &>(stmt).name);
                break;
            default:
                break;
        }
    }

    void visitExpr(const Expr &expr) override
    {
        if (expr.kind == ExprKind::Call)
            onCall(static_cast<const CallExpr &>(expr));
    }

  private:
    /// Result of resolving an expression to a dotted path.
    struct Resolved
    {
        std::string path;
        int depth = 0;
        bool tracked = false; ///< Reached through an import, alias or dynamic import.
    };

    AstAudit &audit_;

    void hit(uint32_t line, Capability c, std::string symbol)
    {
        hits.push_back(StructuralHit{line, c, std::move(symbol)});
    }

    std::optional<Resolved> resolve(const Expr &expr) const
    {
        switch (expr.kind)
        {
            case ExprKind::Name:
            {
                const auto &name = static_cast<const NameExpr &>(expr).name;
                auto it = audit_.aliases_.find(name);
                if (it != audit_.aliases_.end())
                    return Resolved{it->second.target, it->second.depth, true};
                for (const auto &m : audit_.starModules_)
                {
                    std::string qualified = m + "." + name;
                    if (capabilityOf(qualified))
                        return Resolved{std::move(qualified), 1, true};
                }
                return Resolved{name, 0, false};
            }
            case ExprKind::Attribute:
            {
                const auto &a = static_cast<const AttributeExpr &>(expr);
                auto base = resolve(*a.object);
                if (!base)
                    return std::nullopt;
                base->path += "." + a.attr;
                return base;
            }
            case ExprKind::Call:
            {
                const auto &call = static_cast<const CallExpr &>(expr);
                auto callee = resolve(*call.callee);
                if (!callee)
                    return std::nullopt;
                if (callee->path == "__import__" || callee->path == "importlib.import_module")
                {
                    if (const auto *lit = stringArg(call, 0, "name"))
                        return Resolved{lit->value, callee->depth, true};
                    return std::nullopt;
                }
                if (callee->path == "getattr" && call.args.size() >= 2)
                {
                    auto base = resolve(*call.args[0]);
                    const auto *attr = stringArg(call, 1, "");
                    if (!base || !attr)
                        return std::nullopt;
                    base->path += "." + attr->value;
                    return base;
                }
                return std::nullopt;
            }
            default:
                return std::nullopt;
        }
    }

    void bind(const std::string &name, std::string target, int depth)
    {
        if (depth > kMaxAliasDepth)
        {
            audit_.aliases_.erase(name);
            return;
        }
        audit_.aliases_[name] = Alias{std::move(target), depth};
    }

    void onImport(const ImportStmt &s)
    {
        for (const auto &alias : s.names)
        {
            if (alias.asName.empty())
            {
                const std::string root = alias.module.substr(0, alias.module.find('.'));
                bind(root, root, 0);
            }
            else
            {
                bind(alias.asName, alias.module, 1);
            }
            if (isRestrictedModule(alias.module))
                hit(s.loc.line, Capability::RestrictedImport, alias.module);
        }
    }

    void onImportFrom(const ImportFromStmt &s)
    {
        for (const auto &alias : s.names)
        {
            if (alias.module == "*")
                audit_.starModules_.insert(s.module);
            else
                bind(alias.asName.empty() ? alias.module : alias.asName, s.module + "." + alias.module, 1);
        }
        if (isRestrictedModule(s.module))
            hit(s.loc.line, Capability::RestrictedImport, s.module);
    }

    void onAssign(const AssignStmt &s)
    {
        auto value = resolve(*s.value);
        const bool interesting = value && (value->tracked || capabilityOf(value->path));
        for (const auto &target : s.targets)
        {
            if (target->kind != ExprKind::Name)
                continue;
            const auto &name = static_cast<const NameExpr &>(*target).name;
            if (interesting)
                bind(name, value->path, value->depth + 1);
            else
                audit_.aliases_.erase(name);
        }
    }

    void onCall(const CallExpr &call)
    {
        auto callee = resolve(*call.callee);
        if (!callee)
            return;
        const uint32_t line = call.loc.line;
        const std::string &path = callee->path;

        if (path == "__import__" || path == "importlib.import_module")
        {
            const auto *lit = stringArg(call, 0, "name");
            if (!lit)
                hit(line, Capability::DynamicEval, path);
            else if (isRestrictedModule(lit->value))
                hit(line, Capability::RestrictedImport, lit->value);
            return;
        }
        if (path == "open" || path == "io.open" || path == "builtins.open")
        {
            if (!hasArg(call, 1, "mode"))
                return;
            const auto *mode = stringArg(call, 1, "mode");
            if (!mode || mode->value.find_first_of("wax+") != std::string::npos)
                hit(line, Capability::FileWrite, path);
            return;
        }
        if (auto cap = capabilityOf(path))
            hit(line, *cap, path);
    }
};

std::vector<StructuralHit> AstAudit::audit(const Module &module)
{
    Walker walker(*this);
    walker.walk(module);
    std::stable_sort(walker.hits.begin(), walker.hits.end(),
                     [](const StructuralHit &a, const StructuralHit &b) { return a.line < b.line; });
    return std::move(walker.hits);
}

std::string AstAudit::resolveName(const std::string &name) const
{
    auto it = aliases_.find(name);
    return it == aliases_.end() ? name : it->second.target;
}

} // namespace fusion::security
