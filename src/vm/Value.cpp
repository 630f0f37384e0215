//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Value.cpp
// Purpose: Construction, access, equality and hashing of native values.
// Key invariants: Numeric keys that compare equal (1, 1.0, True) share one
//                 dict slot.
// Ownership/Lifetime: See Value.hpp.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "vm/Value.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace fusion::vm
{

Value Value::boolean(bool b)
{
    return Value(Kind::Bool, b);
}

Value Value::integer(int64_t i)
{
    return Value(Kind::Int, i);
}

Value Value::real(double d)
{
    return Value(Kind::Float, d);
}

Value Value::string(std::string s)
{
    return Value(Kind::Str, std::move(s));
}

Value Value::list(ValueList items)
{
    return Value(Kind::List, std::make_shared<ValueList>(std::move(items)));
}

Value Value::tuple(ValueList items)
{
    return Value(Kind::Tuple, std::make_shared<ValueList>(std::move(items)));
}

Value Value::dict()
{
    return Value(Kind::Dict, std::make_shared<DictObject>());
}

Value Value::dict(std::shared_ptr<DictObject> d)
{
    return Value(Kind::Dict, std::move(d));
}

Value Value::function(std::shared_ptr<FunctionObject> f)
{
    return Value(Kind::Function, std::move(f));
}

Value Value::module(std::shared_ptr<ModuleObject> m)
{
    return Value(Kind::Module, std::move(m));
}

Value Value::exception(NativeErrorKind kind, std::string message)
{
    return Value(Kind::Exception,
                 std::make_shared<ExceptionObject>(ExceptionObject{kind, std::move(message)}));
}

namespace
{

[[noreturn]] void wrongKind(const Value &v, std::string_view wanted)
{
    throwNative(NativeErrorKind::TypeError,
                "expected " + std::string(wanted) + ", got '" + std::string(v.typeName()) + "'");
}

} // namespace

bool Value::asBool() const
{
    if (kind_ != Kind::Bool)
        wrongKind(*this, "bool");
    return std::get<bool>(data_);
}

int64_t Value::asInt() const
{
    if (kind_ == Kind::Int)
        return std::get<int64_t>(data_);
    if (kind_ == Kind::Bool)
        return std::get<bool>(data_) ? 1 : 0;
    wrongKind(*this, "int");
}

double Value::asFloat() const
{
    if (kind_ == Kind::Float)
        return std::get<double>(data_);
    if (isIntegral())
        return static_cast<double>(asInt());
    wrongKind(*this, "float");
}

const std::string &Value::asStr() const
{
    if (kind_ != Kind::Str)
        wrongKind(*this, "str");
    return std::get<std::string>(data_);
}

ValueList &Value::asList() const
{
    if (kind_ != Kind::List)
        wrongKind(*this, "list");
    return *std::get<std::shared_ptr<ValueList>>(data_);
}

const ValueList &Value::asTuple() const
{
    if (kind_ != Kind::Tuple)
        wrongKind(*this, "tuple");
    return *std::get<std::shared_ptr<ValueList>>(data_);
}

const ValueList &Value::elements() const
{
    if (kind_ != Kind::List && kind_ != Kind::Tuple)
        wrongKind(*this, "list or tuple");
    return *std::get<std::shared_ptr<ValueList>>(data_);
}

DictObject &Value::asDict() const
{
    if (kind_ != Kind::Dict)
        wrongKind(*this, "dict");
    return *std::get<std::shared_ptr<DictObject>>(data_);
}

FunctionObject &Value::asFunction() const
{
    if (kind_ != Kind::Function)
        wrongKind(*this, "function");
    return *std::get<std::shared_ptr<FunctionObject>>(data_);
}

ModuleObject &Value::asModule() const
{
    if (kind_ != Kind::Module)
        wrongKind(*this, "module");
    return *std::get<std::shared_ptr<ModuleObject>>(data_);
}

const ExceptionObject &Value::asException() const
{
    if (kind_ != Kind::Exception)
        wrongKind(*this, "exception");
    return *std::get<std::shared_ptr<ExceptionObject>>(data_);
}

const void *Value::identity() const noexcept
{
    switch (kind_)
    {
        case Kind::List:
        case Kind::Tuple:
            return std::get<std::shared_ptr<ValueList>>(data_).get();
        case Kind::Dict:
            return std::get<std::shared_ptr<DictObject>>(data_).get();
        case Kind::Function:
            return std::get<std::shared_ptr<FunctionObject>>(data_).get();
        case Kind::Module:
            return std::get<std::shared_ptr<ModuleObject>>(data_).get();
        case Kind::Exception:
            return std::get<std::shared_ptr<ExceptionObject>>(data_).get();
        default:
            return nullptr;
    }
}

bool Value::truthy() const
{
    switch (kind_)
    {
        case Kind::None:
            return false;
        case Kind::Bool:
            return std::get<bool>(data_);
        case Kind::Int:
            return std::get<int64_t>(data_) != 0;
        case Kind::Float:
            return std::get<double>(data_) != 0.0;
        case Kind::Str:
            return !std::get<std::string>(data_).empty();
        case Kind::List:
        case Kind::Tuple:
            return !std::get<std::shared_ptr<ValueList>>(data_)->empty();
        case Kind::Dict:
            return std::get<std::shared_ptr<DictObject>>(data_)->size() != 0;
        case Kind::Function:
        case Kind::Module:
        case Kind::Exception:
            return true;
    }
    return false;
}

std::string_view Value::typeName() const noexcept
{
    switch (kind_)
    {
        case Kind::None:
            return "NoneType";
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "int";
        case Kind::Float:
            return "float";
        case Kind::Str:
            return "str";
        case Kind::List:
            return "list";
        case Kind::Tuple:
            return "tuple";
        case Kind::Dict:
            return "dict";
        case Kind::Function:
            return "function";
        case Kind::Module:
            return "module";
        case Kind::Exception:
            return "exception";
    }
    return "object";
}

Value Value::deepCopy() const
{
    switch (kind_)
    {
        case Kind::List:
        case Kind::Tuple:
        {
            ValueList copy;
            const auto &src = elements();
            copy.reserve(src.size());
            for (const auto &v : src)
                copy.push_back(v.deepCopy());
            return kind_ == Kind::List ? list(std::move(copy)) : tuple(std::move(copy));
        }
        case Kind::Dict:
        {
            auto d = std::make_shared<DictObject>();
            for (const auto &[k, v] : asDict().entries())
                d->set(k.deepCopy(), v.deepCopy());
            return dict(std::move(d));
        }
        default:
            return *this;
    }
}

bool operator==(const Value &a, const Value &b)
{
    using Kind = Value::Kind;
    if (a.isNumber() && b.isNumber())
    {
        if (a.isIntegral() && b.isIntegral())
            return a.asInt() == b.asInt();
        return a.asFloat() == b.asFloat();
    }
    if (a.kind() != b.kind())
        return false;
    switch (a.kind())
    {
        case Kind::None:
            return true;
        case Kind::Str:
            return a.asStr() == b.asStr();
        case Kind::List:
        case Kind::Tuple:
        {
            if (a.identity() == b.identity())
                return true;
            const auto &x = a.elements();
            const auto &y = b.elements();
            if (x.size() != y.size())
                return false;
            for (size_t i = 0; i < x.size(); ++i)
            {
                if (x[i] != y[i])
                    return false;
            }
            return true;
        }
        case Kind::Dict:
        {
            if (a.identity() == b.identity())
                return true;
            const auto &x = a.asDict();
            const auto &y = b.asDict();
            if (x.size() != y.size())
                return false;
            for (const auto &[k, v] : x.entries())
            {
                const Value *other = y.find(k);
                if (!other || *other != v)
                    return false;
            }
            return true;
        }
        case Kind::Exception:
            return a.identity() == b.identity() ||
                   (a.asException().kind == b.asException().kind &&
                    a.asException().message == b.asException().message);
        default:
            return a.identity() == b.identity();
    }
}

std::string hashKey(const Value &key)
{
    using Kind = Value::Kind;
    switch (key.kind())
    {
        case Kind::None:
            return "n";
        case Kind::Bool:
        case Kind::Int:
            return "i:" + std::to_string(key.asInt());
        case Kind::Float:
        {
            const double d = key.asFloat();
            if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.2e18)
                return "i:" + std::to_string(static_cast<int64_t>(d));
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof bits);
            return "f:" + std::to_string(bits);
        }
        case Kind::Str:
            return "s:" + key.asStr();
        case Kind::Tuple:
        {
            std::string out = "t(";
            for (const auto &v : key.asTuple())
            {
                out += hashKey(v);
                out.push_back('\x1f');
            }
            out.push_back(')');
            return out;
        }
        default:
            throwNative(NativeErrorKind::TypeError,
                        "unhashable type: '" + std::string(key.typeName()) + "'");
    }
}

const Value *DictObject::find(const Value &key) const
{
    auto it = index_.find(hashKey(key));
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

Value *DictObject::find(const Value &key)
{
    auto it = index_.find(hashKey(key));
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

void DictObject::set(const Value &key, Value value)
{
    std::string h = hashKey(key);
    auto it = index_.find(h);
    if (it != index_.end())
    {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(std::move(h), entries_.size());
    entries_.emplace_back(key, std::move(value));
}

bool DictObject::erase(const Value &key)
{
    auto it = index_.find(hashKey(key));
    if (it == index_.end())
        return false;
    const size_t pos = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    index_.erase(it);
    for (auto &[k, slot] : index_)
    {
        if (slot > pos)
            --slot;
    }
    return true;
}

void DictObject::clear()
{
    entries_.clear();
    index_.clear();
}

} // namespace fusion::vm
