//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Environment.hpp
// Purpose: Global namespace shared by every block of one run.
// Key invariants: A name is bound in at most one of the variable, function
//                 and module tables. Iteration order is lexicographic.
// Ownership/Lifetime: Exclusively owned by the dispatcher for one run; the
//                     native executor mutates it in place, other executors
//                     only see snapshots.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Value.hpp"

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace fusion::vm
{

class Environment
{
  public:
    using Table = std::map<std::string, Value>;

    /// @brief Find a global binding in any table.
    const Value *lookup(const std::string &name) const;

    bool contains(const std::string &name) const
    {
        return lookup(name) != nullptr;
    }

    /// @brief Bind @p name, routing functions and modules to their tables.
    void assign(const std::string &name, Value value);

    /// @brief Remove a binding; returns false when @p name was unbound.
    bool erase(const std::string &name);

    /// @brief Record an in-place mutation of an existing binding.
    void touch(const std::string &name);

    const Table &variables() const noexcept
    {
        return variables_;
    }

    const Table &functions() const noexcept
    {
        return functions_;
    }

    const Table &modules() const noexcept
    {
        return modules_;
    }

    size_t size() const noexcept
    {
        return variables_.size() + functions_.size() + modules_.size();
    }

    /// @brief Deep copy of the data variables; callables and modules are
    ///        excluded because they never cross a process boundary.
    Table snapshot() const;

    /// @brief Start recording names bound, rebound or deleted.
    void beginDelta();

    /// @brief Names changed since beginDelta(), in first-change order.
    std::vector<std::string> takeDelta();

    /// @brief Module instance already loaded under its canonical name.
    const Value *loadedModule(const std::string &name) const;

    void cacheModule(const std::string &name, Value module);

  private:
    void noteChange(const std::string &name);

    Table variables_;
    Table functions_;
    Table modules_;
    Table loaded_;

    bool tracking_ = false;
    std::vector<std::string> delta_;
    std::unordered_set<std::string> deltaSeen_;
};

} // namespace fusion::vm
