/*
 * File: retry.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-22
 * License: MIT
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "strata/core/error.hpp"
#include "strata/core/logging.hpp"
#include "strata/storage/backing_store.hpp"

namespace strata::storage {

    struct retry_policy {
        std::size_t max_attempts = 4;
        std::chrono::microseconds initial_backoff{ 1000 };
    };

    // Runs `fn` (returning io_status) until it yields something other than
    // io_status::transient or the attempts run out. Exhausted retries and
    // io_status::fatal raise fatal_io_error. ok and not_found are returned.
    template <typename Fn>
    io_status with_retry(const retry_policy& policy, const char* what, page_id pid, Fn&& fn) {
        auto backoff = policy.initial_backoff;
        const std::size_t attempts = policy.max_attempts ? policy.max_attempts : 1;
        for (std::size_t attempt = 1; ; ++attempt) {
            const io_status st = fn();
            if (st == io_status::ok || st == io_status::not_found) {
                return st;
            }
            if (st == io_status::fatal) {
                STRATA_LOG_ERROR("io", what, " of page ", pid, " failed: medium fault");
                throw core::fatal_io_error(std::string(what) + " of page " + std::to_string(pid)
                    + " failed: medium fault", pid);
            }
            if (attempt >= attempts) {
                STRATA_LOG_ERROR("io", what, " of page ", pid, " failed after ", attempt, " attempts");
                throw core::fatal_io_error(std::string(what) + " of page " + std::to_string(pid)
                    + " failed after " + std::to_string(attempt) + " attempts", pid);
            }
            STRATA_LOG_WARN("io", what, " of page ", pid, " transient failure, attempt ",
                attempt, "/", attempts, ", retrying in ", backoff.count(), "us");
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

} // namespace strata::storage
