#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_OUTPUT_MAP_H
#define TXCOMBINE_MERGE_OUTPUT_MAP_H

#include "primitives/amount.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace merge {

using Script = std::vector<uint8_t>;

// ---------------------------------------------------------------------------
// OutputMap -- script -> cumulative amount, in first-insertion order
// ---------------------------------------------------------------------------
class OutputMap {
public:
    struct Entry {
        Script             script;
        primitives::Amount amount;

        bool operator==(const Entry&) const = default;
    };

    /// Adds @p amount to the entry for @p script, creating it at the end
    /// when absent. Returns true when an existing entry absorbed it.
    bool add(const Script& script, primitives::Amount amount);

    [[nodiscard]] std::optional<primitives::Amount> find(
        const Script& script) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry>       entries_;
    std::map<Script, size_t> index_;
};

// ---------------------------------------------------------------------------
// ChangeOutputSet -- wallet-owned scripts, first-seen order, no duplicates
// ---------------------------------------------------------------------------
class ChangeOutputSet {
public:
    /// Returns false when @p script is already present.
    bool add(const Script& script);

    [[nodiscard]] bool contains(const Script& script) const {
        return seen_.count(script) != 0;
    }

    /// The script whose output absorbs fee adjustments: the first one
    /// added. nullptr when the set is empty.
    [[nodiscard]] const Script* anchor() const {
        return scripts_.empty() ? nullptr : &scripts_.front();
    }

    [[nodiscard]] const std::vector<Script>& scripts() const { return scripts_; }
    [[nodiscard]] size_t size() const { return scripts_.size(); }
    [[nodiscard]] bool empty() const { return scripts_.empty(); }

private:
    std::vector<Script> scripts_;
    std::set<Script>    seen_;
};

} // namespace merge

#endif // TXCOMBINE_MERGE_OUTPUT_MAP_H
