/*
 * File: error.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <stdexcept>
#include <string>

#include "strata/core/types.hpp"

namespace strata::core {

    enum class error_kind {
        fatal_io,
        corruption,
        capacity,
    };

    inline const char* to_string(error_kind k) noexcept {
        switch (k) {
        case error_kind::fatal_io:   return "fatal_io";
        case error_kind::corruption: return "corruption";
        case error_kind::capacity:   return "capacity";
        }
        return "unknown";
    }

    // Base of every failure the engine surfaces to callers.
    // A missing key is not an error: lookups return an empty optional.
    class storage_error : public std::runtime_error {
    public:
        storage_error(error_kind kind, const std::string& what, page_id pid = invalid_page_id)
            : std::runtime_error(what)
            , kind_(kind)
            , pid_(pid)
        {}

        error_kind kind() const noexcept {
            return kind_;
        }

        // invalid_page_id when the failure is not tied to one page
        page_id page() const noexcept {
            return pid_;
        }

    private:
        error_kind kind_;
        page_id pid_;
    };

    // Retries exhausted or the medium reported an unrecoverable fault.
    class fatal_io_error : public storage_error {
    public:
        explicit fatal_io_error(const std::string& what, page_id pid = invalid_page_id)
            : storage_error(error_kind::fatal_io, what, pid)
        {}
    };

    // Undecodable record, bad checksum or a broken page chain.
    class corruption_error : public storage_error {
    public:
        explicit corruption_error(const std::string& what, page_id pid = invalid_page_id)
            : storage_error(error_kind::corruption, what, pid)
        {}
    };

    // The cache could not free a frame (everything pinned or unwritable).
    class capacity_error : public storage_error {
    public:
        explicit capacity_error(const std::string& what)
            : storage_error(error_kind::capacity, what)
        {}
    };

} // namespace strata::core
