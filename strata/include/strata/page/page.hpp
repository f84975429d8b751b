/*
 * File: page.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-18
 * License: MIT
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>

#include "strata/core/types.hpp"
#include "strata/core/debug.hpp"

namespace strata::page {

    using core::page_id;

    // A bounded, contiguous, sorted partition [first_key, next_first_key)
    // of the keyspace. An empty first_key means the lower bound is
    // unbounded (head page), an empty next_first_key means this is the
    // last page.
    //
    // Entries and fences are guarded by mutex(); callers hold it shared to
    // read and exclusive to modify. The page itself never locks.
    template <typename KeyT, typename ValueT, typename LessT = std::less<KeyT>>
    class page {
    public:
        using key_type = KeyT;
        using value_type = ValueT;
        using less_type = LessT;
        using entries_type = std::map<KeyT, ValueT, LessT>;
        using fence_type = std::optional<KeyT>;

        page(page_id id, fence_type first, fence_type next, entries_type entries = {})
            : id_(id)
            , first_(std::move(first))
            , next_(std::move(next))
            , entries_(std::move(entries))
        {}

        page(const page&) = delete;
        page& operator = (const page&) = delete;

        page_id id() const noexcept {
            return id_;
        }

        const fence_type& first_key() const noexcept {
            return first_;
        }

        const fence_type& next_first_key() const noexcept {
            return next_;
        }

        void set_next_first_key(fence_type next) {
            next_ = std::move(next);
        }

        bool is_head() const noexcept {
            return !first_.has_value();
        }

        bool is_last() const noexcept {
            return !next_.has_value();
        }

        bool covers(const key_type& key) const {
            const less_type less{};
            if (first_ && less(key, *first_)) {
                return false;
            }
            if (next_ && !less(key, *next_)) {
                return false;
            }
            return true;
        }

        const entries_type& entries() const noexcept {
            return entries_;
        }

        entries_type& entries() noexcept {
            return entries_;
        }

        std::size_t size() const noexcept {
            return entries_.size();
        }

        bool empty() const noexcept {
            return entries_.empty();
        }

        const value_type* find(const key_type& key) const {
            auto itr = entries_.find(key);
            return itr == entries_.end() ? nullptr : &itr->second;
        }

        // Key at the middle position; the split point of an overfull page.
        const key_type& median_key() const {
            STRATA_ASSERT(entries_.size() >= 2, "Nothing to split");
            auto mid = std::next(entries_.begin(), static_cast<std::ptrdiff_t>(entries_.size() / 2));
            return mid->first;
        }

        // Removes and returns every entry with key >= from.
        entries_type extract_from(const key_type& from) {
            entries_type upper;
            auto itr = entries_.lower_bound(from);
            while (itr != entries_.end()) {
                auto next = std::next(itr);
                upper.insert(upper.end(), entries_.extract(itr));
                itr = next;
            }
            return upper;
        }

        // Undo of extract_from / target of a merge. Keys must lie above
        // every key already present.
        void append_entries(entries_type& other) {
            entries_.merge(other);
            STRATA_ASSERT(other.empty(), "Overlapping key ranges");
        }

        std::uint64_t generation() const noexcept {
            return generation_.load(std::memory_order_acquire);
        }

        void bump_generation() noexcept {
            generation_.fetch_add(1, std::memory_order_acq_rel);
        }

        bool is_dirty() const noexcept {
            return dirty_.load(std::memory_order_acquire);
        }

        void mark_dirty() noexcept {
            dirty_.store(true, std::memory_order_release);
        }

        void clear_dirty() noexcept {
            dirty_.store(false, std::memory_order_release);
        }

        // Merged away. A retired page stays valid memory while pinned but
        // owns no keys; lookups that reach it must re-resolve.
        bool is_retired() const noexcept {
            return retired_.load(std::memory_order_acquire);
        }

        void retire() noexcept {
            retired_.store(true, std::memory_order_release);
        }

        bool is_corrupted() const noexcept {
            return corrupted_.load(std::memory_order_acquire);
        }

        void mark_corrupted() noexcept {
            corrupted_.store(true, std::memory_order_release);
        }

        std::uint64_t write_seq() const noexcept {
            return write_seq_.load(std::memory_order_acquire);
        }

        void set_write_seq(std::uint64_t seq) noexcept {
            write_seq_.store(seq, std::memory_order_release);
        }

        // Encoded size at the last write back (0 if never written).
        std::size_t size_bytes() const noexcept {
            return size_bytes_.load(std::memory_order_relaxed);
        }

        void set_size_bytes(std::size_t bytes) noexcept {
            size_bytes_.store(bytes, std::memory_order_relaxed);
        }

        std::shared_mutex& mutex() const noexcept {
            return mutex_;
        }

    private:
        const page_id id_;
        fence_type first_;
        fence_type next_;
        entries_type entries_;
        std::atomic<std::uint64_t> write_seq_{ 0 };
        std::atomic<std::uint64_t> generation_{ 1 };
        std::atomic<std::size_t> size_bytes_{ 0 };
        std::atomic<bool> dirty_{ false };
        std::atomic<bool> retired_{ false };
        std::atomic<bool> corrupted_{ false };
        mutable std::shared_mutex mutex_;
    };

} // namespace strata::page
