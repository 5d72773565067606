// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/output_map.h"

namespace merge {

bool OutputMap::add(const Script& script, primitives::Amount amount) {
    auto it = index_.find(script);
    if (it != index_.end()) {
        entries_[it->second].amount += amount;
        return true;
    }
    index_.emplace(script, entries_.size());
    entries_.push_back(Entry{script, amount});
    return false;
}

std::optional<primitives::Amount> OutputMap::find(const Script& script) const {
    auto it = index_.find(script);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].amount;
}

bool ChangeOutputSet::add(const Script& script) {
    if (!seen_.insert(script).second) return false;
    scripts_.push_back(script);
    return true;
}

} // namespace merge
