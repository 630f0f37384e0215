//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/RunConfig.cpp
// Purpose: Line-oriented manifest parser for fusion.config.
// Key invariants: Scalar keys may appear at most once; `toolchain` and
//                 `rule` may repeat, later entries winning.
// Ownership/Lifetime: See RunConfig.hpp.
// Links: docs/configuration.md
//
//===----------------------------------------------------------------------===//

#include "exec/RunConfig.hpp"

#include <charconv>
#include <fstream>
#include <set>

namespace fusion::exec
{

namespace
{

/// @brief Make a diagnostic error with a message.
support::Diag makeErr(const std::string &msg)
{
    return support::makeError("ConfigError", {}, msg);
}

/// @brief Make a diagnostic error with file:line context.
support::Diag makeManifestErr(const std::string &path, int line, const std::string &msg)
{
    return makeErr(path + ":" + std::to_string(line) + ": " + msg);
}

/// @brief Parse an on/off boolean value.
support::Expected<bool> parseBool(const std::string &val, const std::string &path, int line, const std::string &key)
{
    if (val == "on" || val == "true" || val == "yes")
        return true;
    if (val == "off" || val == "false" || val == "no")
        return false;
    return makeManifestErr(path, line, "invalid value '" + val + "' for " + key + "; expected on or off");
}

/// @brief Parse a strictly positive integer.
support::Expected<uint64_t> parsePositive(const std::string &val, const std::string &path, int line,
                                          const std::string &key)
{
    uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), n);
    if (ec != std::errc() || ptr != val.data() + val.size() || n == 0)
        return makeManifestErr(path, line, "invalid value '" + val + "' for " + key + "; expected a positive integer");
    return n;
}

/// @brief Split "a b" into its first word and the trimmed remainder.
std::pair<std::string, std::string> splitFirst(const std::string &text)
{
    const auto space = text.find_first_of(" \t");
    if (space == std::string::npos)
        return {text, {}};
    const auto rest = text.find_first_not_of(" \t", space);
    return {text.substr(0, space), rest == std::string::npos ? std::string() : text.substr(rest)};
}

} // anonymous namespace

support::Expected<RunConfig> parseRunConfig(std::istream &in, const std::string &path)
{
    RunConfig config;
    std::set<std::string> seen;

    std::string line;
    int lineNum = 0;
    while (std::getline(in, line))
    {
        ++lineNum;

        // Strip leading/trailing whitespace
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        if (line.empty() || line[0] == '#')
            continue;

        auto [key, value] = splitFirst(line);
        if (value.empty())
            return makeManifestErr(path, lineNum, "key missing value: '" + line + "'");

        const bool repeatable = key == "toolchain" || key == "rule";
        if (!repeatable && !seen.insert(key).second)
            return makeManifestErr(path, lineNum, "duplicate key '" + key + "'");

        if (key == "level")
        {
            auto level = security::parseSecurityLevel(value);
            if (!level)
                return makeManifestErr(path, lineNum,
                                       "invalid level '" + value + "'; expected low, medium, high or strict");
            config.level = *level;
        }
        else if (key == "block-timeout" || key == "compile-timeout" || key == "native-timeout")
        {
            auto ms = parsePositive(value, path, lineNum, key);
            if (!ms)
                return ms.error();
            const std::chrono::milliseconds d{static_cast<int64_t>(ms.value())};
            if (key == "block-timeout")
                config.blockTimeout = d;
            else if (key == "compile-timeout")
                config.compileTimeout = d;
            else
                config.nativeTimeout = d;
        }
        else if (key == "native-steps")
        {
            auto steps = parsePositive(value, path, lineNum, key);
            if (!steps)
                return steps.error();
            config.nativeStepBudget = steps.value();
        }
        else if (key == "fallback")
        {
            if (value == "stub")
                config.fallback = FallbackPolicy::Stub;
            else if (value == "fail")
                config.fallback = FallbackPolicy::Fail;
            else
                return makeManifestErr(path, lineNum, "invalid fallback '" + value + "'; expected stub or fail");
        }
        else if (key == "toolchain")
        {
            auto [tool, exe] = splitFirst(value);
            if (exe.empty())
                return makeManifestErr(path, lineNum, "toolchain requires a tool name and a path");
            config.toolchains[tool] = exe;
        }
        else if (key == "rule")
        {
            auto [id, setting] = splitFirst(value);
            if (setting.empty())
                return makeManifestErr(path, lineNum, "rule requires an id and a severity or 'off'");
            if (setting == "off")
            {
                config.ruleOverrides.emplace_back(id, std::nullopt);
            }
            else if (auto sev = security::parseSeverity(setting))
            {
                config.ruleOverrides.emplace_back(id, *sev);
            }
            else
            {
                return makeManifestErr(path, lineNum,
                                       "invalid severity '" + setting + "'; expected low, medium, high, critical or off");
            }
        }
        else if (key == "trace")
        {
            auto b = parseBool(value, path, lineNum, key);
            if (!b)
                return b.error();
            config.trace = b.value();
        }
        else
        {
            return makeManifestErr(path, lineNum, "unknown key '" + key + "'");
        }
    }
    return config;
}

support::Expected<RunConfig> loadRunConfig(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return makeErr("cannot open config: " + path);
    return parseRunConfig(file, path);
}

support::Expected<security::RuleSet> buildRuleSet(const RunConfig &config)
{
    auto rules = security::RuleSet::defaults();
    for (const auto &[id, severity] : config.ruleOverrides)
    {
        if (!rules.override(id, severity))
            return makeErr("unknown security rule '" + id + "'");
    }
    return rules;
}

} // namespace fusion::exec
