// root_registry.cpp

#include "root_registry.hpp"

#include "errors.hpp"

namespace merkledrop {

Hash32 RootRegistry::root_of(uint64_t period) const {
    auto it = roots_.find(period);
    return (it != roots_.end()) ? it->second : Hash32{};
}

bool RootRegistry::insert(uint64_t period, const Hash32& root, std::string& err) {
    if (hash32_is_zero(root)) { err = errc::zero_root; return false; }
    if (roots_.count(period) != 0) { err = errc::root_already_set; return false; }
    roots_.emplace(period, root);
    err.clear();
    return true;
}

void RootRegistry::for_each(const std::function<void(uint64_t, const Hash32&)>& fn) const {
    for (const auto& kv : roots_) fn(kv.first, kv.second);
}

} // namespace merkledrop
