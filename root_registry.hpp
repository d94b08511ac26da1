#pragma once

#include "hash.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace merkledrop {

// Insert-only period -> root map. There is no overwrite and no erase
// outside of rolling back the insert that the same call made.
class RootRegistry {
public:
    // Zero hash when unset.
    Hash32 root_of(uint64_t period) const;
    bool has_root(uint64_t period) const { return roots_.count(period) != 0; }

    // Fails root_already_set / zero_root.
    bool insert(uint64_t period, const Hash32& root, std::string& err);

    // Only for undoing this call's own insert.
    void rollback_insert(uint64_t period) { roots_.erase(period); }

    size_t size() const { return roots_.size(); }
    bool empty() const { return roots_.empty(); }
    void for_each(const std::function<void(uint64_t, const Hash32&)>& fn) const;

private:
    std::unordered_map<uint64_t, Hash32> roots_;
};

} // namespace merkledrop
