/*
 * File: stats.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <cstddef>

namespace strata::cache {

struct cache_stats {
    std::uint64_t hits = 0, misses = 0, loads = 0, evictions = 0;
    std::uint64_t writes = 0, writebacks_on_evict = 0, failed_writebacks = 0;
    std::uint64_t capacity_waits = 0;
    std::size_t resident = 0;
    void reset() { *this = {}; }
};

} // namespace strata::cache
