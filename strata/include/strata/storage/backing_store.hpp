/*
 * File: backing_store.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-08
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/types.hpp"

namespace strata::storage {

    using core::page_id;

    enum class io_status {
        ok,
        not_found,
        transient,  // worth retrying
        fatal,
    };

    inline const char* to_string(io_status s) noexcept {
        switch (s) {
        case io_status::ok:        return "ok";
        case io_status::not_found: return "not_found";
        case io_status::transient: return "transient";
        case io_status::fatal:     return "fatal";
        }
        return "unknown";
    }

    // Durable medium addressed by page id. Records are opaque, variable
    // sized and replaced whole. Implementations must tolerate concurrent
    // calls on different ids.
    template <class S>
    concept BackingStore = requires(
        S store,
        page_id pid,
        core::byte_buffer& out,
        core::byte_view in,
        std::vector<page_id>& ids
    ) {
        { store.is_open() }            -> std::convertible_to<bool>;
        { store.read_page(pid, out) }  -> std::same_as<io_status>;
        { store.write_page(pid, in) }  -> std::same_as<io_status>;
        { store.delete_page(pid) }     -> std::same_as<io_status>;
        { store.list_pages(ids) }      -> std::same_as<io_status>;
    };

} // namespace strata::storage
