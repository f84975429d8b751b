/*
 * File: settings.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-11-23
 * License: MIT
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "strata/storage/retry.hpp"

namespace strata {

    struct settings {
        std::size_t min_entries = 32;
        std::size_t max_entries = 128;
        std::size_t cache_pages = 64;
        std::size_t scan_batch = 256;
        std::chrono::milliseconds capacity_wait{ 200 };
        storage::retry_policy io_retry{};

        void validate() const {
            if (min_entries == 0) {
                throw std::invalid_argument("min_entries must be at least 1");
            }
            if (max_entries < 2 * min_entries) {
                throw std::invalid_argument("max_entries (" + std::to_string(max_entries)
                    + ") must be at least twice min_entries (" + std::to_string(min_entries) + ")");
            }
            // a split pins the old and the new page, a merge pins both
            // neighbours of the shrinking page
            if (cache_pages < 3) {
                throw std::invalid_argument("cache_pages must be at least 3");
            }
            if (scan_batch == 0) {
                throw std::invalid_argument("scan_batch must be at least 1");
            }
            if (io_retry.max_attempts == 0) {
                throw std::invalid_argument("io_retry.max_attempts must be at least 1");
            }
        }
    };

    static_assert(settings{}.max_entries >= 2 * settings{}.min_entries, "default thresholds must be valid");
}
