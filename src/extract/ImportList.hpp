//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/ImportList.hpp
// Purpose: Ordered, de-duplicated collection of import specifiers.
// Key invariants: Insertion order of first appearance is preserved; empty
//                 specifiers and repeats are ignored.
// Ownership/Lifetime: Owns copies of every specifier.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace thymus::extract
{

class ImportList
{
  public:
    /// @brief Append @p spec unless it is empty or already present.
    /// @return True when the specifier was added.
    bool add(std::string spec)
    {
        if (spec.empty() || !seen_.insert(spec).second)
            return false;
        items_.push_back(std::move(spec));
        return true;
    }

    [[nodiscard]] const std::vector<std::string> &items() const
    {
        return items_;
    }

    [[nodiscard]] bool empty() const
    {
        return items_.empty();
    }

    [[nodiscard]] std::size_t size() const
    {
        return items_.size();
    }

    /// @brief Move the specifiers out of the list.
    std::vector<std::string> release()
    {
        seen_.clear();
        return std::move(items_);
    }

  private:
    std::vector<std::string> items_;
    std::unordered_set<std::string> seen_;
};

} // namespace thymus::extract
