//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/SandboxModules.cpp
// Purpose: The small set of modules native blocks may import: math, random
//          and time.
// Key invariants: Each call to makeSandboxModule returns an independent
//                 instance; random state lives in the instance.
//                 time.sleep never sleeps past the interpreter's limits.
// Ownership/Lifetime: Modules are owned by the environment's module cache.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Builtins.hpp"

#include "vm/Interpreter.hpp"
#include "vm/Operators.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <thread>

namespace fusion::vm
{

namespace
{

using detail::bindArgs;
using detail::floatArg;
using detail::intArg;
using detail::makeBuiltin;

constexpr double kPi = 3.141592653589793;
constexpr double kE = 2.718281828459045;

[[noreturn]] void domainError()
{
    throwNative(NativeErrorKind::ValueError, "math domain error");
}

void addFn(ModuleObject &m, const std::string &name, BuiltinFn fn)
{
    m.attrs[name] = makeBuiltin(name, std::move(fn));
}

/// Register a one-argument float function; @p domain rejects inputs.
template <typename F, typename D> void addUnary(ModuleObject &m, const std::string &name, F fn, D domain)
{
    addFn(m, name, [name, fn, domain](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs(name, args, kwargs, {"x"}, 1);
        const double x = floatArg(name, *a[0]);
        if (!domain(x))
            domainError();
        return Value::real(fn(x));
    });
}

void addUnary(ModuleObject &m, const std::string &name, double (*fn)(double))
{
    addUnary(m, name, fn, [](double) { return true; });
}

/// floor/ceil/trunc return ints; non-finite input cannot be converted.
void addRounding(ModuleObject &m, const std::string &name, double (*fn)(double))
{
    addFn(m, name, [name, fn](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs(name, args, kwargs, {"x"}, 1);
        if (a[0]->isIntegral())
            return Value::integer(a[0]->asInt());
        const double r = fn(floatArg(name, *a[0]));
        if (std::isnan(r))
            throwNative(NativeErrorKind::ValueError, "cannot convert float NaN to integer");
        if (std::isinf(r))
            throwNative(NativeErrorKind::OverflowError, "cannot convert float infinity to integer");
        if (r >= 9.2233720368547758e18 || r < -9.2233720368547758e18)
            throwNative(NativeErrorKind::OverflowError, "integer result too large");
        return Value::integer(static_cast<int64_t>(r));
    });
}

std::shared_ptr<ModuleObject> makeMath()
{
    auto m = std::make_shared<ModuleObject>();
    m->name = "math";
    ModuleObject &mod = *m;
    mod.attrs["pi"] = Value::real(kPi);
    mod.attrs["e"] = Value::real(kE);
    mod.attrs["tau"] = Value::real(2 * kPi);
    mod.attrs["inf"] = Value::real(std::numeric_limits<double>::infinity());
    mod.attrs["nan"] = Value::real(std::numeric_limits<double>::quiet_NaN());

    addUnary(mod, "sqrt", [](double x) { return std::sqrt(x); }, [](double x) { return x >= 0; });
    addUnary(mod, "log10", [](double x) { return std::log10(x); }, [](double x) { return x > 0; });
    addUnary(mod, "log2", [](double x) { return std::log2(x); }, [](double x) { return x > 0; });
    addUnary(mod, "asin", [](double x) { return std::asin(x); }, [](double x) { return x >= -1 && x <= 1; });
    addUnary(mod, "acos", [](double x) { return std::acos(x); }, [](double x) { return x >= -1 && x <= 1; });
    addUnary(mod, "sin", [](double x) { return std::sin(x); });
    addUnary(mod, "cos", [](double x) { return std::cos(x); });
    addUnary(mod, "tan", [](double x) { return std::tan(x); });
    addUnary(mod, "atan", [](double x) { return std::atan(x); });
    addUnary(mod, "fabs", [](double x) { return std::fabs(x); });
    addUnary(mod, "degrees", [](double x) { return x * 180.0 / kPi; });
    addUnary(mod, "radians", [](double x) { return x * kPi / 180.0; });
    addUnary(mod, "exp", [](double x) {
        const double r = std::exp(x);
        if (std::isinf(r) && std::isfinite(x))
            throwNative(NativeErrorKind::OverflowError, "math range error");
        return r;
    });
    addRounding(mod, "floor", [](double x) { return std::floor(x); });
    addRounding(mod, "ceil", [](double x) { return std::ceil(x); });
    addRounding(mod, "trunc", [](double x) { return std::trunc(x); });

    addFn(mod, "log", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("log", args, kwargs, {"x", "base"}, 1);
        const double x = floatArg("log", *a[0]);
        if (x <= 0)
            domainError();
        if (!a[1])
            return Value::real(std::log(x));
        const double base = floatArg("log", *a[1]);
        if (base <= 0 || base == 1)
            domainError();
        return Value::real(std::log(x) / std::log(base));
    });
    addFn(mod, "pow", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("pow", args, kwargs, {"x", "y"}, 2);
        const double x = floatArg("pow", *a[0]);
        const double y = floatArg("pow", *a[1]);
        if (x == 0 && y < 0)
            domainError();
        if (x < 0 && std::floor(y) != y)
            domainError();
        return Value::real(std::pow(x, y));
    });
    addFn(mod, "atan2", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("atan2", args, kwargs, {"y", "x"}, 2);
        return Value::real(std::atan2(floatArg("atan2", *a[0]), floatArg("atan2", *a[1])));
    });
    addFn(mod, "hypot", [](Interpreter &, ValueList &args, KeywordArgs &) {
        double acc = 0;
        for (const auto &v : args)
            acc = std::hypot(acc, floatArg("hypot", v));
        return Value::real(acc);
    });
    addFn(mod, "isnan", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("isnan", args, kwargs, {"x"}, 1);
        return Value::boolean(std::isnan(floatArg("isnan", *a[0])));
    });
    addFn(mod, "isinf", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("isinf", args, kwargs, {"x"}, 1);
        return Value::boolean(std::isinf(floatArg("isinf", *a[0])));
    });
    addFn(mod, "isfinite", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("isfinite", args, kwargs, {"x"}, 1);
        return Value::boolean(std::isfinite(floatArg("isfinite", *a[0])));
    });
    addFn(mod, "factorial", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("factorial", args, kwargs, {"n"}, 1);
        const int64_t n = intArg("factorial", *a[0]);
        if (n < 0)
            throwNative(NativeErrorKind::ValueError, "factorial() not defined for negative values");
        int64_t acc = 1;
        for (int64_t i = 2; i <= n; ++i)
        {
            if (__builtin_mul_overflow(acc, i, &acc))
                throwNative(NativeErrorKind::OverflowError, "integer overflow");
        }
        return Value::integer(acc);
    });
    addFn(mod, "gcd", [](Interpreter &, ValueList &args, KeywordArgs &) {
        int64_t acc = 0;
        for (const auto &v : args)
            acc = std::gcd(acc, intArg("gcd", v));
        return Value::integer(acc < 0 ? -acc : acc);
    });
    return m;
}

/// Generator state shared by the functions of one random module instance.
struct RandomState
{
    std::mt19937_64 engine{std::random_device{}()};

    double unit()
    {
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine);
    }

    int64_t between(int64_t lo, int64_t hi)
    {
        return std::uniform_int_distribution<int64_t>(lo, hi)(engine);
    }
};

std::shared_ptr<ModuleObject> makeRandom()
{
    auto m = std::make_shared<ModuleObject>();
    m->name = "random";
    auto state = std::make_shared<RandomState>();
    ModuleObject &mod = *m;

    addFn(mod, "seed", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("seed", args, kwargs, {"a"}, 0);
        if (!a[0] || a[0]->isNone())
            state->engine.seed(std::random_device{}());
        else if (a[0]->isIntegral())
            state->engine.seed(static_cast<uint64_t>(a[0]->asInt()));
        else
            state->engine.seed(std::hash<std::string>{}(hashKey(*a[0])));
        return Value::none();
    });
    addFn(mod, "random", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        bindArgs("random", args, kwargs, {}, 0);
        return Value::real(state->unit());
    });
    addFn(mod, "uniform", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("uniform", args, kwargs, {"a", "b"}, 2);
        const double lo = floatArg("uniform", *a[0]);
        const double hi = floatArg("uniform", *a[1]);
        return Value::real(lo + (hi - lo) * state->unit());
    });
    addFn(mod, "randint", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("randint", args, kwargs, {"a", "b"}, 2);
        const int64_t lo = intArg("randint", *a[0]);
        const int64_t hi = intArg("randint", *a[1]);
        if (lo > hi)
            throwNative(NativeErrorKind::ValueError, "empty range for randint()");
        return Value::integer(state->between(lo, hi));
    });
    addFn(mod, "randrange", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("randrange", args, kwargs, {"start", "stop", "step"}, 1);
        int64_t start = 0;
        int64_t stop = intArg("randrange", *a[0]);
        if (a[1])
        {
            start = stop;
            stop = intArg("randrange", *a[1]);
        }
        const int64_t step = a[2] ? intArg("randrange", *a[2]) : 1;
        if (step == 0)
            throwNative(NativeErrorKind::ValueError, "zero step for randrange()");
        const int64_t count = step > 0 ? (stop - start + step - 1) / step : (start - stop - step - 1) / -step;
        if (count <= 0)
            throwNative(NativeErrorKind::ValueError, "empty range for randrange()");
        return Value::integer(start + step * state->between(0, count - 1));
    });
    addFn(mod, "choice", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("choice", args, kwargs, {"seq"}, 1);
        const ValueList items = iterate(*a[0]);
        if (items.empty())
            throwNative(NativeErrorKind::IndexError, "Cannot choose from an empty sequence");
        return items[static_cast<size_t>(state->between(0, static_cast<int64_t>(items.size()) - 1))];
    });
    addFn(mod, "shuffle", [state](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("shuffle", args, kwargs, {"x"}, 1);
        ValueList &items = a[0]->asList();
        for (size_t i = items.size(); i > 1; --i)
        {
            const auto j = static_cast<size_t>(state->between(0, static_cast<int64_t>(i) - 1));
            std::swap(items[i - 1], items[j]);
        }
        return Value::none();
    });
    return m;
}

double secondsSince(std::chrono::steady_clock::time_point origin)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin).count();
}

std::shared_ptr<ModuleObject> makeTime()
{
    auto m = std::make_shared<ModuleObject>();
    m->name = "time";
    ModuleObject &mod = *m;
    const auto origin = std::chrono::steady_clock::now();

    addFn(mod, "time", [](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        bindArgs("time", args, kwargs, {}, 0);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return Value::real(std::chrono::duration<double>(now).count());
    });
    addFn(mod, "perf_counter", [origin](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        bindArgs("perf_counter", args, kwargs, {}, 0);
        return Value::real(secondsSince(origin));
    });
    addFn(mod, "monotonic", [origin](Interpreter &, ValueList &args, KeywordArgs &kwargs) {
        bindArgs("monotonic", args, kwargs, {}, 0);
        return Value::real(secondsSince(origin));
    });
    addFn(mod, "sleep", [](Interpreter &interp, ValueList &args, KeywordArgs &kwargs) {
        auto a = bindArgs("sleep", args, kwargs, {"secs"}, 1);
        const double secs = floatArg("sleep", *a[0]);
        if (secs < 0 || std::isnan(secs))
            throwNative(NativeErrorKind::ValueError, "sleep length must be non-negative");
        using SteadyDuration = std::chrono::steady_clock::duration;
        const std::chrono::steady_clock::time_point until =
            std::chrono::steady_clock::now() +
            std::chrono::duration_cast<SteadyDuration>(std::chrono::duration<double>(secs));
        // Sleep in slices so timeouts and cancellation stay responsive.
        while (true)
        {
            interp.checkLimits();
            const auto now = std::chrono::steady_clock::now();
            if (now >= until)
                break;
            const SteadyDuration slice =
                std::min<SteadyDuration>(until - now, std::chrono::milliseconds(20));
            std::this_thread::sleep_for(slice);
        }
        return Value::none();
    });
    return m;
}

} // namespace

const std::vector<std::string> &sandboxModuleNames()
{
    static const std::vector<std::string> names = {"math", "random", "time"};
    return names;
}

std::shared_ptr<ModuleObject> makeSandboxModule(const std::string &name)
{
    if (name == "math")
        return makeMath();
    if (name == "random")
        return makeRandom();
    if (name == "time")
        return makeTime();
    return nullptr;
}

} // namespace fusion::vm
