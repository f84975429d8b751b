/*
 * File: store.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-24
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "strata/core/debug.hpp"
#include "strata/core/error.hpp"
#include "strata/core/logging.hpp"
#include "strata/core/types.hpp"
#include "strata/cache/page_cache.hpp"
#include "strata/cache/stats.hpp"
#include "strata/storage/backing_store.hpp"
#include "strata/storage/retry.hpp"
#include "strata/model.hpp"
#include "strata/settings.hpp"

namespace strata {

    using core::page_id;

    // Copy of one page taken under its lock. get_next_first_key() is the
    // fence of the following page (none for the last one); passing it to
    // store::page_at() walks the keyspace page by page.
    template <typename KeyT, typename ValueT>
    class page_snapshot {
    public:
        using key_type = KeyT;
        using value_type = ValueT;
        using fence_type = std::optional<KeyT>;
        using entry_type = std::pair<KeyT, ValueT>;

        page_snapshot(page_id id, fence_type first, fence_type next,
                      std::uint64_t generation, std::vector<entry_type> entries)
            : id_(id)
            , first_(std::move(first))
            , next_(std::move(next))
            , generation_(generation)
            , entries_(std::move(entries))
        {}

        page_id id() const noexcept { return id_; }
        const fence_type& first_key() const noexcept { return first_; }
        const fence_type& get_next_first_key() const noexcept { return next_; }
        bool is_last() const noexcept { return !next_.has_value(); }
        std::uint64_t generation() const noexcept { return generation_; }
        const std::vector<entry_type>& entries() const noexcept { return entries_; }
        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

    private:
        page_id id_;
        fence_type first_;
        fence_type next_;
        std::uint64_t generation_;
        std::vector<entry_type> entries_;
    };

    struct store_stats {
        std::uint64_t entries = 0;
        std::size_t pages = 0;
        std::uint64_t splits = 0;
        std::uint64_t merges = 0;
        cache::cache_stats cache{};
    };

    struct verify_report {
        std::size_t pages = 0;
        std::uint64_t entries = 0;
        std::vector<std::string> problems;

        bool ok() const noexcept {
            return problems.empty();
        }
    };

    // Paged ordered map over a backing store.
    //
    // Keys are partitioned into pages chained by their fences. The index
    // routes a key to its page, the cache keeps a bounded set of pages
    // resident, and every operation works on one pinned, locked page at a
    // time (two or three for split and merge, locked left to right).
    template <concepts::StoreModel ModelT, storage::BackingStore StoreT>
    class store {

        using traits = model_traits<ModelT>;

    public:
        using model_type = ModelT;
        using backing_store_type = StoreT;
        using key_type = typename traits::key_type;
        using value_type = typename traits::value_type;
        using less_type = typename traits::less_type;
        using page_type = typename traits::page_type;
        using page_codec_type = typename traits::page_codec_type;
        using manifest_type = typename traits::manifest_type;
        using manifest_codec_type = typename traits::manifest_codec_type;
        using index_type = typename traits::index_type;
        using cache_type = cache::page_cache<page_type, StoreT, page_codec_type>;
        using page_handle = typename cache_type::page_handle;
        using fence_type = std::optional<key_type>;
        using entry_type = std::pair<key_type, value_type>;
        using snapshot_type = page_snapshot<key_type, value_type>;

        // Forward cursor over (key, value) pairs. Entries are copied out of
        // one page at a time in batches; no pin or lock is held between
        // batches, so a cursor may be kept indefinitely.
        class cursor {
        public:
            using iterator_category = std::input_iterator_tag;
            using iterator_concept = std::input_iterator_tag;
            using value_type = entry_type;
            using difference_type = std::ptrdiff_t;
            using reference = const entry_type&;
            using pointer = const entry_type*;

            cursor() = default;

            reference operator * () const {
                return batch_[pos_];
            }

            pointer operator -> () const {
                return &batch_[pos_];
            }

            cursor& operator ++ () {
                if (++pos_ >= batch_.size() && owner_) {
                    owner_->fill(*this);
                }
                return *this;
            }

            cursor operator ++ (int) {
                auto tmp = *this;
                ++(*this);
                return tmp;
            }

            bool at_end() const noexcept {
                return pos_ >= batch_.size();
            }

            friend bool operator == (const cursor& c, std::default_sentinel_t) noexcept {
                return c.at_end();
            }

        private:
            friend class store;

            cursor(store* owner, fence_type from, bool inclusive)
                : owner_(owner)
                , from_(std::move(from))
                , inclusive_(inclusive)
            {
                owner_->fill(*this);
            }

            store* owner_ = nullptr;
            std::vector<entry_type> batch_;
            std::size_t pos_ = 0;
            fence_type from_;               // last delivered key, or the start key
            bool inclusive_ = true;
            fence_type hint_;               // fence of the page to read next
            page_id page_ = core::invalid_page_id;
            std::uint64_t generation_ = 0;
            bool done_ = false;
        };

        class scan_range {
        public:
            cursor begin() const {
                return owner_->make_cursor(from_, inclusive_);
            }

            std::default_sentinel_t end() const noexcept {
                return {};
            }

        private:
            friend class store;

            scan_range(store* owner, fence_type from, bool inclusive)
                : owner_(owner)
                , from_(std::move(from))
                , inclusive_(inclusive)
            {}

            store* owner_;
            fence_type from_;
            bool inclusive_;
        };

        store(backing_store_type& backing, settings cfg = {})
            : backing_(&backing)
            , cfg_(validated(cfg))
            , cache_(backing, cache::cache_config{ cfg_.cache_pages, cfg_.capacity_wait, cfg_.io_retry })
        {}

        store(const store&) = delete;
        store& operator = (const store&) = delete;

        ~store() {
            if (!is_open()) {
                return;
            }
            try {
                close();
            }
            catch (const std::exception& e) {
                STRATA_LOG_ERROR("store", "close on destruction failed, unflushed changes are lost: ", e.what());
            }
        }

        const settings& config() const noexcept {
            return cfg_;
        }

        bool is_open() const noexcept {
            return open_.load(std::memory_order_acquire);
        }

        // Reads the manifest and rebuilds the index. A store that was not
        // closed cleanly is recovered from its page records.
        void open() {
            std::lock_guard<std::mutex> lck(lifecycle_mutex_);
            if (is_open()) {
                return;
            }
            if (!backing_->is_open()) {
                throw core::fatal_io_error("backing store is not open");
            }
            cache_.reset_identity();
            try {
                core::byte_buffer bytes;
                const auto st = storage::with_retry(cfg_.io_retry, "read", core::manifest_page_id, [&] {
                    return backing_->read_page(core::manifest_page_id, bytes);
                });
                std::optional<manifest_type> mf;
                if (st == storage::io_status::ok) {
                    try {
                        mf = manifest_codec_type::decode(bytes);
                    }
                    catch (const core::corruption_error& e) {
                        STRATA_LOG_ERROR("store", "manifest is unreadable, recovering from page records: ", e.what());
                    }
                }

                if (mf && mf->clean) {
                    index_.reset(mf->head, std::move(mf->fences));
                    entry_count_.store(mf->entries);
                    next_page_id_.store(mf->next_page_id);
                    cache_.set_write_seq(mf->write_seq);
                    STRATA_LOG_INFO("store", "opened: ", index_.size(), " pages, ", mf->entries, " entries");
                }
                else {
                    const page_id head = mf ? mf->head : core::first_data_page_id;
                    const page_id next = mf ? mf->next_page_id : core::first_data_page_id;
                    const std::uint64_t seq = mf ? mf->write_seq : 0;
                    if (!recover(head, next, seq)) {
                        initialise();
                        STRATA_LOG_INFO("store", "initialised an empty store");
                    }
                }
                write_manifest(false);
            }
            catch (...) {
                cache_.clear_unpinned();
                index_.reset(core::invalid_page_id);
                throw;
            }
            open_.store(true, std::memory_order_release);
        }

        // Checkpoint: writes back every dirty page, then the manifest.
        void flush_all() {
            ensure_open();
            cache_.flush_all();
            write_manifest(false);
        }

        void close() {
            std::lock_guard<std::mutex> lck(lifecycle_mutex_);
            if (!is_open()) {
                return;
            }
            cache_.flush_all();
            write_manifest(true);
            open_.store(false, std::memory_order_release);
            cache_.clear_unpinned();
            STRATA_LOG_INFO("store", "closed: ", index_.size(), " pages, ", size(), " entries");
        }

        std::optional<value_type> get(const key_type& key) {
            ensure_open();
            auto [ph, lck] = lock_owner<std::shared_lock<std::shared_mutex>>(key);
            if (auto v = ph->find(key)) {
                return *v;
            }
            return std::nullopt;
        }

        bool contains(const key_type& key) {
            ensure_open();
            auto [ph, lck] = lock_owner<std::shared_lock<std::shared_mutex>>(key);
            return ph->find(key) != nullptr;
        }

        void put(const key_type& key, value_type value) {
            put_impl(key, std::move(value));
        }

        // put() returning the value it replaced
        std::optional<value_type> get_put(const key_type& key, value_type value) {
            return put_impl(key, std::move(value));
        }

        void remove(const key_type& key) {
            remove_impl(key);
        }

        // remove() returning the removed value
        std::optional<value_type> take(const key_type& key) {
            return remove_impl(key);
        }

        // Removes every key in [start, end). Returns the number removed.
        std::size_t remove_range(const key_type& start, const key_type& end) {
            ensure_open();
            const less_type less{};
            if (!less(start, end)) {
                return 0;
            }
            std::size_t removed = 0;
            scan_range range = scan(start);
            for (;;) {
                std::vector<key_type> keys;
                for (auto itr = range.begin(); itr != std::default_sentinel; ++itr) {
                    if (!less(itr->first, end) || keys.size() >= cfg_.scan_batch) {
                        break;
                    }
                    keys.push_back(itr->first);
                }
                for (const auto& k : keys) {
                    if (remove_impl(k)) {
                        ++removed;
                    }
                }
                if (keys.size() < cfg_.scan_batch) {
                    return removed;
                }
                range = scan_after(keys.back());
            }
        }

        scan_range scan() {
            ensure_open();
            return scan_range(this, std::nullopt, true);
        }

        // keys >= start
        scan_range scan(const key_type& start) {
            ensure_open();
            return scan_range(this, start, true);
        }

        // keys > key; resumes an abandoned scan
        scan_range scan_after(const key_type& key) {
            ensure_open();
            return scan_range(this, key, false);
        }

        std::optional<key_type> first_key() {
            auto range = scan();
            auto itr = range.begin();
            if (itr == std::default_sentinel) {
                return std::nullopt;
            }
            return itr->first;
        }

        std::optional<key_type> last_key() {
            ensure_open();
            fence_type upper;
            for (;;) {
                const auto resolve = [&] { return upper ? index_.left_of(*upper) : index_.last().second; };
                const page_id pid = resolve();
                auto ph = pin_routed(pid, resolve);
                if (!ph) {
                    upper.reset();
                    continue;
                }
                std::shared_lock<std::shared_mutex> lck(ph->mutex());
                if (ph->is_retired() || !same_fence(ph->next_first_key(), upper)) {
                    upper.reset();
                    continue;
                }
                if (!ph->empty()) {
                    return ph->entries().rbegin()->first;
                }
                if (ph->is_head()) {
                    return std::nullopt;
                }
                upper = ph->first_key();
            }
        }

        // The page owning `key`.
        snapshot_type page_at(const key_type& key) {
            ensure_open();
            auto [ph, lck] = lock_owner<std::shared_lock<std::shared_mutex>>(key);
            return make_snapshot(*ph);
        }

        // The leftmost page.
        snapshot_type head_page() {
            ensure_open();
            for (;;) {
                auto ph = cache_.acquire(index_.head());
                if (!ph) {
                    continue;
                }
                std::shared_lock<std::shared_mutex> lck(ph->mutex());
                if (ph->is_retired()) {
                    continue;
                }
                return make_snapshot(*ph);
            }
        }

        std::size_t size() const noexcept {
            return static_cast<std::size_t>(entry_count_.load(std::memory_order_relaxed));
        }

        bool empty() const noexcept {
            return size() == 0;
        }

        std::size_t page_count() const {
            return index_.size();
        }

        store_stats stats() const {
            store_stats out;
            out.entries = entry_count_.load(std::memory_order_relaxed);
            out.pages = index_.size();
            out.splits = splits_.load(std::memory_order_relaxed);
            out.merges = merges_.load(std::memory_order_relaxed);
            out.cache = cache_.stats();
            return out;
        }

        // Walks every page in index order and checks the chain, the fences
        // and the entry bounds. Meant for a quiescent store. Pages with a
        // broken fence are flagged so later writes to them are refused.
        verify_report verify() {
            ensure_open();
            verify_report report;
            const auto pages = index_.snapshot();
            for (std::size_t i = 0; i < pages.size(); ++i) {
                const auto& [fence, pid] = pages[i];
                const std::string where = "page " + std::to_string(pid);
                page_handle ph;
                try {
                    ph = cache_.acquire(pid);
                }
                catch (const core::storage_error& e) {
                    report.problems.push_back(where + ": " + e.what());
                    continue;
                }
                if (!ph) {
                    report.problems.push_back(where + ": indexed but retired");
                    continue;
                }
                std::shared_lock<std::shared_mutex> lck(ph->mutex());
                ++report.pages;
                report.entries += ph->size();
                bool broken = false;
                if (!same_fence(ph->first_key(), fence)) {
                    report.problems.push_back(where + ": first key differs from its index entry");
                    broken = true;
                }
                const fence_type expected_next = (i + 1 < pages.size()) ? pages[i + 1].first : fence_type{};
                if (!same_fence(ph->next_first_key(), expected_next)) {
                    report.problems.push_back(where + ": next first key does not match the following page");
                    broken = true;
                }
                for (const auto& kv : ph->entries()) {
                    if (!ph->covers(kv.first)) {
                        report.problems.push_back(where + ": holds a key outside its fences");
                        broken = true;
                        break;
                    }
                }
                if (ph->size() > cfg_.max_entries) {
                    report.problems.push_back(where + ": " + std::to_string(ph->size())
                        + " entries exceed max_entries");
                }
                if (broken) {
                    ph->mark_corrupted();
                }
            }
            if (report.entries != entry_count_.load(std::memory_order_relaxed)) {
                report.problems.push_back("entry counter is " + std::to_string(entry_count_.load())
                    + " but pages hold " + std::to_string(report.entries));
            }
            for (const auto& p : report.problems) {
                STRATA_LOG_WARN("verify", p);
            }
            return report;
        }

    PRIVATE_TESTABLE:

        // Forgets everything in memory without writing it: what a crash
        // leaves behind on the backing store.
        void abandon() {
            std::lock_guard<std::mutex> lck(lifecycle_mutex_);
            open_.store(false, std::memory_order_release);
            cache_.clear_unpinned();
            index_.reset(core::invalid_page_id);
        }

        cache_type& get_cache() noexcept {
            return cache_;
        }

        index_type& get_index() noexcept {
            return index_;
        }

    private:

        static settings validated(const settings& cfg) {
            cfg.validate();
            return cfg;
        }

        void ensure_open() const {
            if (!is_open()) {
                throw std::logic_error("store is not open");
            }
        }

        static bool same_fence(const fence_type& a, const fence_type& b) {
            if (a.has_value() != b.has_value()) {
                return false;
            }
            const less_type less{};
            return !a || (!less(*a, *b) && !less(*b, *a));
        }

        static void ensure_writable(const page_type& pg) {
            if (pg.is_corrupted()) {
                throw core::corruption_error("page " + std::to_string(pg.id())
                    + " is flagged corrupt, writes are refused", pg.id());
            }
        }

        static snapshot_type make_snapshot(const page_type& pg) {
            std::vector<entry_type> entries(pg.entries().begin(), pg.entries().end());
            return snapshot_type(pg.id(), pg.first_key(), pg.next_first_key(),
                pg.generation(), std::move(entries));
        }

        // Pins `pid`, read from the index by `resolve`. A merge may retire
        // and delete the page between the lookup and the pin; the record is
        // then missing but the index no longer routes there, and the empty
        // handle sends the caller back to the index.
        template <typename ResolveT>
        page_handle pin_routed(page_id pid, ResolveT&& resolve) {
            try {
                return cache_.acquire(pid);
            }
            catch (const core::corruption_error&) {
                if (!cache_.is_quarantined(pid) && resolve() != pid) {
                    return {};
                }
                throw;
            }
        }

        // Called with `pg` locked and not covering `key`. Splits and merges
        // update the index before they release the page, so an index that
        // still routes `key` here disagrees with the page's fences.
        void check_routing(page_type& pg, const key_type& key) {
            if (pg.is_corrupted() || index_.locate(key) == pg.id()) {
                pg.mark_corrupted();
                STRATA_LOG_ERROR("store", "page ", pg.id(), " does not cover a key the index routes to it");
                throw core::corruption_error("page " + std::to_string(pg.id())
                    + " has broken fences", pg.id());
            }
        }

        // Pins and locks the page owning `key`. The index may route to a
        // page that was split or merged meanwhile; the fences are checked
        // under the lock and the lookup repeats until they match.
        template <typename LockT>
        std::pair<page_handle, LockT> lock_owner(const key_type& key) {
            for (;;) {
                const page_id pid = index_.locate(key);
                auto ph = pin_routed(pid, [&] { return index_.locate(key); });
                if (!ph) {
                    continue;
                }
                LockT lck(ph->mutex());
                if (ph->is_retired()) {
                    continue;
                }
                if (!ph->covers(key)) {
                    check_routing(*ph, key);
                    continue;
                }
                return { std::move(ph), std::move(lck) };
            }
        }

        std::optional<value_type> put_impl(const key_type& key, value_type value) {
            ensure_open();
            auto [ph, lck] = lock_owner<std::unique_lock<std::shared_mutex>>(key);
            ensure_writable(*ph);
            auto& entries = ph->entries();
            std::optional<value_type> old;
            if (auto itr = entries.find(key); itr != entries.end()) {
                if constexpr (std::equality_comparable<value_type>) {
                    if (itr->second == value) {
                        return itr->second;
                    }
                }
                old = std::move(itr->second);
                itr->second = std::move(value);
            }
            else {
                entries.emplace(key, std::move(value));
            }
            ph->mark_dirty();

            if (ph->size() > cfg_.max_entries) {
                try {
                    split(ph);
                }
                catch (...) {
                    if (old) {
                        entries.insert_or_assign(key, std::move(*old));
                    }
                    else {
                        entries.erase(key);
                    }
                    throw;
                }
            }
            if (!old) {
                entry_count_.fetch_add(1, std::memory_order_relaxed);
            }
            return old;
        }

        // `left_ph` is locked exclusively by the caller. The upper half moves
        // to a new page which is written before the shrunk page, so no
        // durable fence ever names a page that is not on the medium.
        void split(page_handle& left_ph) {
            auto& left = *left_ph;
            const key_type median = left.median_key();
            const fence_type old_next = left.next_first_key();
            const page_id new_id = next_page_id_.fetch_add(1);

            auto right_ph = cache_.admit(std::make_unique<page_type>(new_id, median, old_next));
            right_ph->entries() = left.extract_from(median);
            left.set_next_first_key(median);
            try {
                cache_.write_through_locked(*right_ph);
                cache_.write_through_locked(left);
            }
            catch (const core::storage_error& e) {
                STRATA_LOG_WARN("store", "split of page ", left.id(), " rolled back: ", e.what());
                left.append_entries(right_ph->entries());
                left.set_next_first_key(old_next);
                left.mark_dirty();
                right_ph->retire();
                cache_.discard(right_ph);
                throw;
            }
            const auto left_size = left.size();
            const auto right_size = right_ph->size();
            index_.insert(median, new_id);
            left.bump_generation();
            right_ph->bump_generation();
            splits_.fetch_add(1, std::memory_order_relaxed);
            STRATA_LOG_DEBUG("store", "split page ", left.id(), " (", left_size, " entries) off to page ",
                new_id, " (", right_size, " entries)");
        }

        std::optional<value_type> remove_impl(const key_type& key) {
            ensure_open();
            auto [ph, lck] = lock_owner<std::unique_lock<std::shared_mutex>>(key);
            ensure_writable(*ph);
            auto& entries = ph->entries();
            auto itr = entries.find(key);
            if (itr == entries.end()) {
                return std::nullopt;
            }
            value_type removed = std::move(itr->second);
            entries.erase(itr);
            ph->mark_dirty();

            if (ph->size() < cfg_.min_entries && index_.size() > 1) {
                try {
                    rebalance(ph, lck);
                }
                catch (...) {
                    entries.emplace(key, std::move(removed));
                    throw;
                }
            }
            entry_count_.fetch_sub(1, std::memory_order_relaxed);
            return removed;
        }

        // `ph` is underfull and locked exclusively through `lck`. Merges it
        // with the neighbour that leaves the most room, if any fits.
        // The right neighbour is locked blocking, the left one only tried.
        void rebalance(page_handle& ph, std::unique_lock<std::shared_mutex>& lck) {
            auto& pg = *ph;

            page_handle right_ph;
            std::unique_lock<std::shared_mutex> right_lck;
            if (pg.next_first_key()) {
                const auto rid = index_.find(*pg.next_first_key());
                if (rid) {
                    right_ph = cache_.acquire(*rid);
                }
                if (right_ph) {
                    right_lck = std::unique_lock<std::shared_mutex>(right_ph->mutex());
                }
                if (!right_ph || right_ph->is_retired()
                    || !same_fence(right_ph->first_key(), pg.next_first_key())) {
                    pg.mark_corrupted();
                    throw core::corruption_error("page chain broken after page "
                        + std::to_string(pg.id()), pg.id());
                }
            }

            page_handle left_ph;
            std::unique_lock<std::shared_mutex> left_lck;
            if (pg.first_key()) {
                const auto resolve = [&] { return index_.left_of(*pg.first_key()); };
                left_ph = pin_routed(resolve(), resolve);
                if (left_ph) {
                    left_lck = std::unique_lock<std::shared_mutex>(left_ph->mutex(), std::try_to_lock);
                    if (!left_lck.owns_lock() || left_ph->is_retired()
                        || !same_fence(left_ph->next_first_key(), pg.first_key())) {
                        left_lck = {};
                        left_ph.reset();
                    }
                }
            }

            const auto max = cfg_.max_entries;
            const bool right_fits = right_ph && pg.size() + right_ph->size() <= max;
            const bool left_fits = left_ph && left_ph->size() + pg.size() <= max;
            if (!right_fits && !left_fits) {
                return;
            }
            const bool into_left = left_fits && (!right_fits || left_ph->size() < right_ph->size());
            if (into_left) {
                right_lck = {};
                right_ph.reset();
                merge(*left_ph, ph, lck);
            }
            else {
                left_lck = {};
                left_ph.reset();
                merge(pg, right_ph, right_lck);
            }
        }

        // Both pages locked exclusively. `left` takes over the entries and
        // the next fence of `right`, is written, and only then is `right`
        // dropped from the index and the medium.
        void merge(page_type& left, page_handle& right_ph, std::unique_lock<std::shared_mutex>& right_lck) {
            auto& right = *right_ph;
            const key_type right_first = *right.first_key();
            const fence_type old_next = left.next_first_key();
            const auto right_id = right.id();

            left.append_entries(right.entries());
            left.set_next_first_key(right.next_first_key());
            try {
                cache_.write_through_locked(left);
            }
            catch (const core::storage_error& e) {
                STRATA_LOG_WARN("store", "merge of page ", right_id, " into ", left.id(), " rolled back: ", e.what());
                right.entries() = left.extract_from(right_first);
                left.set_next_first_key(old_next);
                left.mark_dirty();
                throw;
            }
            right.retire();
            right.clear_dirty();
            left.bump_generation();
            right.bump_generation();
            index_.remove(right_first);
            merges_.fetch_add(1, std::memory_order_relaxed);
            STRATA_LOG_DEBUG("store", "merged page ", right_id, " into page ", left.id(),
                " (", left.size(), " entries)");
            right_lck.unlock();
            cache_.discard(right_ph);
        }

        cursor make_cursor(const fence_type& from, bool inclusive) {
            return cursor(this, from, inclusive);
        }

        // Advances `c` to its next non-empty batch, or marks it done.
        void fill(cursor& c) {
            c.batch_.clear();
            c.pos_ = 0;
            while (!c.done_ && c.batch_.empty()) {
                page_handle ph;
                std::shared_lock<std::shared_mutex> lck;
                const fence_type target = c.hint_ ? c.hint_ : c.from_;
                const auto route = [&] { return target ? index_.locate(*target) : index_.head(); };
                if (c.page_ != core::invalid_page_id) {
                    ph = pin_routed(c.page_, route);
                    if (ph) {
                        lck = std::shared_lock<std::shared_mutex>(ph->mutex());
                        if (ph->is_retired() || ph->generation() != c.generation_) {
                            lck = {};
                            ph.reset();
                        }
                    }
                }
                if (!ph) {
                    const page_id pid = route();
                    c.page_ = core::invalid_page_id;
                    ph = pin_routed(pid, route);
                    if (!ph) {
                        continue;
                    }
                    lck = std::shared_lock<std::shared_mutex>(ph->mutex());
                    if (ph->is_retired()) {
                        continue;
                    }
                    if (target && !ph->covers(*target)) {
                        check_routing(*ph, *target);
                        continue;
                    }
                    c.page_ = pid;
                    c.generation_ = ph->generation();
                    c.hint_.reset();
                }

                const auto& entries = ph->entries();
                auto itr = !c.from_ ? entries.begin()
                    : (c.inclusive_ ? entries.lower_bound(*c.from_) : entries.upper_bound(*c.from_));
                for (; itr != entries.end() && c.batch_.size() < cfg_.scan_batch; ++itr) {
                    c.batch_.push_back(*itr);
                }
                if (!c.batch_.empty()) {
                    c.from_ = c.batch_.back().first;
                    c.inclusive_ = false;
                }
                if (itr == entries.end()) {
                    if (ph->is_last()) {
                        c.done_ = true;
                    }
                    else {
                        c.hint_ = ph->next_first_key();
                        c.page_ = core::invalid_page_id;
                    }
                }
            }
        }

        void initialise() {
            auto ph = cache_.admit(std::make_unique<page_type>(core::first_data_page_id, std::nullopt, std::nullopt));
            cache_.write_through(ph);
            index_.reset(core::first_data_page_id);
            entry_count_.store(0);
            next_page_id_.store(core::first_data_page_id + 1);
        }

        struct found_record {
            page_id id;
            fence_type first;
            fence_type next;
            std::uint64_t write_seq;
            std::size_t entries;
        };

        // Rebuilds the index by walking the chain from the head page. Where
        // two records claim the same fence the one written last wins; page
        // records the walk does not reach are deleted. Returns false when
        // the medium holds no page records at all.
        bool recover(page_id head, page_id next_hint, std::uint64_t seq_hint) {
            std::vector<page_id> ids;
            storage::with_retry(cfg_.io_retry, "list", core::invalid_page_id, [&] {
                return backing_->list_pages(ids);
            });

            std::map<page_id, found_record> records;
            page_id max_id = 0;
            std::uint64_t max_seq = seq_hint;
            std::size_t unreadable = 0;
            for (auto pid : ids) {
                if (pid == core::manifest_page_id) {
                    continue;
                }
                max_id = std::max(max_id, pid);
                core::byte_buffer bytes;
                const auto st = storage::with_retry(cfg_.io_retry, "read", pid, [&] {
                    return backing_->read_page(pid, bytes);
                });
                if (st == storage::io_status::not_found) {
                    continue;
                }
                try {
                    auto pg = page_codec_type::decode(pid, bytes);
                    max_seq = std::max(max_seq, pg->write_seq());
                    records.emplace(pid, found_record{ pid, pg->first_key(), pg->next_first_key(),
                        pg->write_seq(), pg->size() });
                }
                catch (const core::corruption_error& e) {
                    STRATA_LOG_ERROR("recovery", "skipping unreadable page ", pid, ": ", e.what());
                    ++unreadable;
                }
            }
            if (records.empty() && unreadable == 0) {
                return false;
            }
            STRATA_LOG_WARN("recovery", "store was not closed cleanly, rebuilding from ",
                records.size(), " page records");

            auto head_itr = records.find(head);
            if (head_itr == records.end() || head_itr->second.first) {
                throw core::corruption_error("head page " + std::to_string(head)
                    + " is missing or unreadable", head);
            }

            std::map<key_type, const found_record*, less_type> by_fence;
            for (const auto& [pid, rec] : records) {
                if (!rec.first) {
                    continue;
                }
                auto [itr, inserted] = by_fence.emplace(*rec.first, &rec);
                if (!inserted && rec.write_seq > itr->second->write_seq) {
                    itr->second = &rec;
                }
            }

            const less_type less{};
            std::vector<std::pair<key_type, page_id>> fences;
            std::set<page_id> reachable{ head };
            std::uint64_t entries = head_itr->second.entries;
            const found_record* cur = &head_itr->second;
            while (cur->next) {
                auto itr = by_fence.find(*cur->next);
                if (itr == by_fence.end()) {
                    throw core::corruption_error("page chain broken after page "
                        + std::to_string(cur->id), cur->id);
                }
                const found_record* nxt = itr->second;
                if (cur->first && !less(*cur->first, *nxt->first)) {
                    throw core::corruption_error("page chain out of order after page "
                        + std::to_string(cur->id), cur->id);
                }
                fences.emplace_back(*nxt->first, nxt->id);
                reachable.insert(nxt->id);
                entries += nxt->entries;
                cur = nxt;
            }

            std::size_t orphans = 0;
            for (const auto& [pid, rec] : records) {
                if (reachable.count(pid)) {
                    continue;
                }
                try {
                    storage::with_retry(cfg_.io_retry, "delete", pid, [&] {
                        return backing_->delete_page(pid);
                    });
                    ++orphans;
                }
                catch (const core::storage_error& e) {
                    STRATA_LOG_WARN("recovery", "could not delete orphaned page ", pid, ": ", e.what());
                }
            }

            index_.reset(head, std::move(fences));
            entry_count_.store(entries);
            next_page_id_.store(std::max(next_hint, max_id + 1));
            cache_.set_write_seq(max_seq);
            STRATA_LOG_INFO("recovery", "recovered ", reachable.size(), " pages, ", entries,
                " entries, removed ", orphans, " orphaned records");
            return true;
        }

        void write_manifest(bool clean) {
            std::lock_guard<std::mutex> lck(manifest_mutex_);
            manifest_type mf;
            mf.clean = clean;
            mf.head = index_.head();
            mf.next_page_id = next_page_id_.load();
            mf.write_seq = cache_.write_seq();
            mf.entries = entry_count_.load();
            mf.fences = index_.fences();
            const auto bytes = manifest_codec_type::encode(mf);
            storage::with_retry(cfg_.io_retry, "write", core::manifest_page_id, [&] {
                return backing_->write_page(core::manifest_page_id, bytes);
            });
        }

        backing_store_type* backing_ = nullptr;
        settings cfg_;
        cache_type cache_;
        index_type index_;
        std::atomic<bool> open_{ false };
        std::atomic<std::uint64_t> entry_count_{ 0 };
        std::atomic<page_id> next_page_id_{ core::first_data_page_id };
        std::atomic<std::uint64_t> splits_{ 0 };
        std::atomic<std::uint64_t> merges_{ 0 };
        std::mutex lifecycle_mutex_;
        std::mutex manifest_mutex_;
    };

} // namespace strata
