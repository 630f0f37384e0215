//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Environment.cpp
// Purpose: Implements the run-wide global namespace.
// Key invariants: See Environment.hpp.
// Ownership/Lifetime: Values are owned by the tables.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "vm/Environment.hpp"

namespace fusion::vm
{

const Value *Environment::lookup(const std::string &name) const
{
    for (const Table *t : {&variables_, &functions_, &modules_})
    {
        auto it = t->find(name);
        if (it != t->end())
            return &it->second;
    }
    return nullptr;
}

void Environment::assign(const std::string &name, Value value)
{
    Table *target = &variables_;
    if (value.kind() == Value::Kind::Function)
        target = &functions_;
    else if (value.kind() == Value::Kind::Module)
        target = &modules_;

    for (Table *t : {&variables_, &functions_, &modules_})
    {
        if (t != target)
            t->erase(name);
    }
    (*target)[name] = std::move(value);
    noteChange(name);
}

bool Environment::erase(const std::string &name)
{
    bool removed = false;
    for (Table *t : {&variables_, &functions_, &modules_})
        removed = t->erase(name) > 0 || removed;
    if (removed)
        noteChange(name);
    return removed;
}

void Environment::touch(const std::string &name)
{
    if (contains(name))
        noteChange(name);
}

Environment::Table Environment::snapshot() const
{
    Table copy;
    for (const auto &[name, value] : variables_)
        copy.emplace(name, value.deepCopy());
    return copy;
}

void Environment::beginDelta()
{
    tracking_ = true;
    delta_.clear();
    deltaSeen_.clear();
}

std::vector<std::string> Environment::takeDelta()
{
    tracking_ = false;
    deltaSeen_.clear();
    return std::move(delta_);
}

const Value *Environment::loadedModule(const std::string &name) const
{
    auto it = loaded_.find(name);
    return it == loaded_.end() ? nullptr : &it->second;
}

void Environment::cacheModule(const std::string &name, Value module)
{
    loaded_.emplace(name, std::move(module));
}

void Environment::noteChange(const std::string &name)
{
    if (tracking_ && deltaSeen_.insert(name).second)
        delta_.push_back(name);
}

} // namespace fusion::vm
