#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace merkledrop {

// Runs fn(i) for i in [0, n) on up to hardware_concurrency threads.
// Stops handing out work after the first fn that returns false.
template <typename Fn>
bool parallel_for(size_t n, Fn&& fn) {
    if (n == 0) return true;
    const unsigned hw = std::max(1u, std::thread::hardware_concurrency());
    const unsigned threads = (unsigned)std::min<size_t>(n, hw);

    std::atomic<bool> stop{false};
    std::vector<std::thread> ts;
    ts.reserve(threads);

    for (unsigned t = 0; t < threads; t++) {
        ts.emplace_back([&, t]() {
            for (size_t i = (size_t)t; i < n && !stop.load(std::memory_order_relaxed); i += threads) {
                if (!fn(i)) stop.store(true, std::memory_order_relaxed);
            }
        });
    }
    for (auto& th : ts) th.join();
    return !stop.load(std::memory_order_relaxed);
}

} // namespace merkledrop
