/*
 * File: page_cache.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/debug.hpp"
#include "strata/core/error.hpp"
#include "strata/core/logging.hpp"
#include "strata/storage/backing_store.hpp"
#include "strata/storage/retry.hpp"
#include "strata/cache/stats.hpp"

namespace strata::cache {

	using core::page_id;

	struct cache_config {
		std::size_t capacity = 64;
		std::chrono::milliseconds capacity_wait{ 200 };
		storage::retry_policy retry{};
	};

	// Bounded set of resident pages over a backing store.
	//
	// A page is resident in a frame. Frames are pinned by page_handle
	// objects; a pinned frame is never evicted. Unpinned frames sit in an
	// LRU list and are evicted (written back first when dirty) once the
	// resident count reaches the capacity. All backing-store I/O happens with
	// the cache mutex released; frames being loaded or written back are
	// marked so concurrent acquirers of the same id wait instead of issuing a
	// second read.
	template <typename PageT, storage::BackingStore StoreT, typename PageCodecT>
	class page_cache {

		enum class frame_state {
			loading,
			resident,
			evicting,
		};

		struct frame {

			frame(page_id p) : pid(p) {}
			frame(const frame&) = delete;
			frame& operator = (const frame&) = delete;

			page_id pid;
			frame_state state = frame_state::loading;
			std::unique_ptr<PageT> page;
			std::size_t pins = 0;
			bool doomed = false;
			bool deleted = false;
			frame* next = nullptr;
			frame* prev = nullptr;
		};

	public:

		using page_type = PageT;
		using store_type = StoreT;
		using codec_type = PageCodecT;

		struct page_handle {

			page_handle() = default;

			page_handle(const page_handle& other) {
				copy_impl(other);
			}

			page_handle& operator = (const page_handle& other) {
				if (this != &other) {
					reset();
					copy_impl(other);
				}
				return *this;
			}

			page_handle(page_handle&& other) noexcept
				: cache_(other.cache_)
				, frame_(other.frame_)
			{
				other.cache_ = nullptr;
				other.frame_ = nullptr;
			}

			page_handle& operator = (page_handle&& other) noexcept {
				if (this != &other) {
					reset();
					cache_ = other.cache_;
					frame_ = other.frame_;
					other.cache_ = nullptr;
					other.frame_ = nullptr;
				}
				return *this;
			}

			~page_handle() {
				reset();
			}

			bool is_valid() const noexcept {
				return frame_ != nullptr;
			}

			explicit operator bool() const noexcept {
				return is_valid();
			}

			page_id pid() const noexcept {
				return frame_ ? frame_->pid : core::invalid_page_id;
			}

			page_type* operator -> () const noexcept {
				STRATA_ASSERT(frame_, "Empty handle");
				return frame_->page.get();
			}

			page_type& operator * () const noexcept {
				STRATA_ASSERT(frame_, "Empty handle");
				return *frame_->page;
			}

			void reset() noexcept {
				if (cache_ && frame_) {
					cache_->unpin(frame_);
				}
				cache_ = nullptr;
				frame_ = nullptr;
			}

		private:
			friend class page_cache;

			page_handle(page_cache* c, frame* f)
				: cache_(c)
				, frame_(f)
			{}

			void copy_impl(const page_handle& other) {
				if (other.cache_ && other.frame_) {
					other.cache_->pin(other.frame_);
					cache_ = other.cache_;
					frame_ = other.frame_;
				}
			}

			page_cache* cache_ = nullptr;
			frame* frame_ = nullptr;
		};

		page_cache(store_type& store, cache_config cfg)
			: store_(&store)
			, cfg_(cfg)
		{
			STRATA_ASSERT(cfg_.capacity > 0, "Cache needs at least one frame");
		}

		page_cache() = delete;
		page_cache(const page_cache&) = delete;
		page_cache& operator = (const page_cache&) = delete;

		// Dirty pages are the owner's responsibility: call flush_all() before
		// destroying the cache to keep them.
		~page_cache() = default;

		// Returns the page pinned. An empty handle means the id was retired
		// by a merge and the caller must re-resolve its key. Once the retired
		// record is deleted and its frame gone the id is forgotten, and a
		// late acquire reports it missing like any other absent page.
		// Throws corruption_error, fatal_io_error, capacity_error.
		page_handle acquire(page_id pid) {
			std::unique_lock<std::mutex> lck(mutex_);
			frame* fs = nullptr;
			for (;;) {
				if (retired_.count(pid)) {
					return {};
				}
				if (quarantined_.count(pid)) {
					throw core::corruption_error("page " + std::to_string(pid) + " is quarantined", pid);
				}
				if (auto itr = frames_.find(pid); itr != frames_.end()) {
					auto f = itr->second.get();
					if (f->state == frame_state::resident) {
						++f->pins;
						touch(f);
						++stats_.hits;
						return page_handle(this, f);
					}
					cv_.wait(lck);
					continue;
				}
				if (frames_.size() >= cfg_.capacity) {
					make_room(lck);
					continue;
				}
				auto owned = std::make_unique<frame>(pid);
				fs = owned.get();
				frames_.emplace(pid, std::move(owned));
				++stats_.misses;
				break;
			}

			lck.unlock();
			std::unique_ptr<page_type> loaded;
			std::exception_ptr failure;
			bool missing = false;
			bool corrupt = false;
			try {
				core::byte_buffer bytes;
				const auto st = storage::with_retry(cfg_.retry, "read", pid, [&] {
					return store_->read_page(pid, bytes);
				});
				if (st == storage::io_status::not_found) {
					missing = true;
				}
				else {
					loaded = codec_type::decode(pid, bytes);
				}
			}
			catch (const core::corruption_error& e) {
				STRATA_LOG_ERROR("cache", "quarantining page ", pid, ": ", e.what());
				failure = std::current_exception();
				corrupt = true;
			}
			catch (const std::exception&) {
				failure = std::current_exception();
			}

			lck.lock();
			if (corrupt) {
				quarantined_.insert(pid);
			}
			if (failure || missing) {
				frames_.erase(pid);
				cv_.notify_all();
				if (failure) {
					std::rethrow_exception(failure);
				}
				if (retired_.count(pid)) {
					return {};
				}
				throw core::corruption_error("page " + std::to_string(pid)
					+ " is referenced but missing from the backing store", pid);
			}
			fs->page = std::move(loaded);
			fs->state = frame_state::resident;
			fs->pins = 1;
			push_frame_used(fs);
			++stats_.loads;
			cv_.notify_all();
			return page_handle(this, fs);
		}

		// Makes a freshly created page resident, pinned and dirty.
		page_handle admit(std::unique_ptr<page_type> pg) {
			STRATA_ASSERT(pg, "Admitting nothing");
			const auto pid = pg->id();
			pg->mark_dirty();
			std::unique_lock<std::mutex> lck(mutex_);
			while (frames_.size() >= cfg_.capacity) {
				make_room(lck);
			}
			STRATA_ASSERT(!frames_.count(pid), "Page id reused");
			auto owned = std::make_unique<frame>(pid);
			auto fs = owned.get();
			fs->page = std::move(pg);
			fs->state = frame_state::resident;
			fs->pins = 1;
			frames_.emplace(pid, std::move(owned));
			push_frame_used(fs);
			return page_handle(this, fs);
		}

		// Writes one page now. The caller holds the page lock (shared or
		// exclusive) so the entries cannot change underneath.
		void write_through_locked(page_type& pg) {
			write_back_locked(pg);
		}

		void write_through(const page_handle& ph) {
			STRATA_ASSERT(ph.is_valid(), "Empty handle");
			std::shared_lock<std::shared_mutex> plck(ph->mutex());
			write_back_locked(*ph);
		}

		// Drops a retired page: its frame goes away with the last pin and is
		// never written back, and its record is deleted from the medium.
		// The id stays in the retired set until both have happened; an id
		// whose record could not be deleted stays there until reset.
		void discard(page_handle& ph) {
			if (!ph.is_valid()) {
				return;
			}
			const auto pid = ph.pid();
			{
				std::lock_guard<std::mutex> lck(mutex_);
				ph.frame_->doomed = true;
				retired_.insert(pid);
			}
			ph.reset();
			try {
				storage::with_retry(cfg_.retry, "delete", pid, [&] {
					return store_->delete_page(pid);
				});
			}
			catch (const core::storage_error& e) {
				// an orphaned record is unreachable from the chain; recovery removes it
				STRATA_LOG_WARN("cache", "could not delete retired page ", pid, ": ", e.what());
				return;
			}
			std::lock_guard<std::mutex> lck(mutex_);
			if (auto itr = frames_.find(pid); itr != frames_.end() && itr->second->doomed) {
				itr->second->deleted = true;
			}
			else {
				retired_.erase(pid);
			}
		}

		// Writes back every dirty resident page, pinning one at a time. Every
		// page is attempted; the first failure is rethrown afterwards.
		void flush_all() {
			std::vector<page_id> dirty;
			{
				std::lock_guard<std::mutex> lck(mutex_);
				for (auto& [pid, owned] : frames_) {
					auto f = owned.get();
					if (f->state == frame_state::resident && !f->doomed && f->page->is_dirty()) {
						dirty.push_back(pid);
					}
				}
			}
			std::exception_ptr first_failure;
			for (auto pid : dirty) {
				page_handle ph = pin_if_resident(pid);
				if (!ph) {
					continue;
				}
				try {
					std::shared_lock<std::shared_mutex> plck(ph->mutex());
					if (!ph->is_retired() && ph->is_dirty()) {
						write_back_locked(*ph);
					}
				}
				catch (const core::storage_error& e) {
					STRATA_LOG_ERROR("cache", "flush of page ", pid, " failed: ", e.what());
					if (!first_failure) {
						first_failure = std::current_exception();
					}
				}
			}
			if (first_failure) {
				std::rethrow_exception(first_failure);
			}
		}

		// Forgets every unpinned page, dirty or not, without writing it.
		// Pinned pages stay. Used to drop the working set after a failed open.
		void clear_unpinned() {
			std::lock_guard<std::mutex> lck(mutex_);
			for (auto itr = frames_.begin(); itr != frames_.end(); ) {
				auto f = itr->second.get();
				if (f->pins == 0 && f->state == frame_state::resident) {
					pop_frame_from_list(f);
					itr = frames_.erase(itr);
				}
				else {
					++itr;
				}
			}
			cv_.notify_all();
		}

		void reset_identity() {
			std::lock_guard<std::mutex> lck(mutex_);
			retired_.clear();
			quarantined_.clear();
		}

		std::size_t retired_pages() const {
			std::lock_guard<std::mutex> lck(mutex_);
			return retired_.size();
		}

		bool is_quarantined(page_id pid) const {
			std::lock_guard<std::mutex> lck(mutex_);
			return quarantined_.count(pid) > 0;
		}

		std::size_t resident_pages() const {
			std::lock_guard<std::mutex> lck(mutex_);
			return frames_.size();
		}

		std::size_t pin_count(page_id pid) const {
			std::lock_guard<std::mutex> lck(mutex_);
			auto itr = frames_.find(pid);
			return itr == frames_.end() ? 0 : itr->second->pins;
		}

		bool is_resident(page_id pid) const {
			std::lock_guard<std::mutex> lck(mutex_);
			return frames_.count(pid) > 0;
		}

		std::size_t capacity() const noexcept {
			return cfg_.capacity;
		}

		cache_stats stats() const {
			std::lock_guard<std::mutex> lck(mutex_);
			auto out = stats_;
			out.resident = frames_.size();
			return out;
		}

		std::uint64_t write_seq() const noexcept {
			return write_seq_.load(std::memory_order_acquire);
		}

		void set_write_seq(std::uint64_t seq) noexcept {
			write_seq_.store(seq, std::memory_order_release);
		}

	private:

		page_handle pin_if_resident(page_id pid) {
			std::lock_guard<std::mutex> lck(mutex_);
			auto itr = frames_.find(pid);
			if (itr == frames_.end()) {
				return {};
			}
			auto f = itr->second.get();
			if (f->state != frame_state::resident || f->doomed) {
				return {};
			}
			++f->pins;
			return page_handle(this, f);
		}

		void pin(frame* f) {
			std::lock_guard<std::mutex> lck(mutex_);
			++f->pins;
		}

		void unpin(frame* f) noexcept {
			std::lock_guard<std::mutex> lck(mutex_);
			STRATA_ASSERT(f->pins > 0, "Trying to unpin an unpinned frame");
			if (--f->pins == 0) {
				if (f->doomed) {
					const auto pid = f->pid;
					if (f->deleted) {
						retired_.erase(pid);
					}
					pop_frame_from_list(f);
					frames_.erase(pid);
				}
				cv_.notify_all();
			}
		}

		// Evicts until a frame is free. Called with `lck` held; releases it
		// around write backs and waits. Throws capacity_error when nothing
		// can be evicted within capacity_wait.
		void make_room(std::unique_lock<std::mutex>& lck) {
			std::unordered_set<page_id> unwritable;
			const auto deadline = std::chrono::steady_clock::now() + cfg_.capacity_wait;
			bool waited = false;
			while (frames_.size() >= cfg_.capacity) {
				frame* victim = find_victim(unwritable);
				if (!victim) {
					if (!unwritable.empty()) {
						throw core::capacity_error("cache full: " + std::to_string(unwritable.size())
							+ " evictable pages could not be written back");
					}
					if (!waited) {
						++stats_.capacity_waits;
						waited = true;
					}
					if (cv_.wait_until(lck, deadline) == std::cv_status::timeout
						&& frames_.size() >= cfg_.capacity && !find_victim(unwritable)) {
						throw core::capacity_error("cache full: all " + std::to_string(frames_.size())
							+ " resident pages are pinned");
					}
					continue;
				}

				if (!victim->page->is_dirty()) {
					evict_frame(victim);
					continue;
				}

				victim->state = frame_state::evicting;
				pop_frame_from_list(victim);
				lck.unlock();
				bool written = false;
				try {
					write_back_locked(*victim->page);
					written = true;
				}
				catch (const core::storage_error& e) {
					STRATA_LOG_WARN("cache", "eviction of page ", victim->pid, " aborted: ", e.what());
				}
				lck.lock();
				if (written) {
					++stats_.writebacks_on_evict;
					evict_frame(victim);
				}
				else {
					++stats_.failed_writebacks;
					unwritable.insert(victim->pid);
					victim->state = frame_state::resident;
					push_frame_unused(victim);
					cv_.notify_all();
				}
			}
		}

		frame* find_victim(const std::unordered_set<page_id>& skip) const {
			for (auto f = last_used_; f; f = f->prev) {
				if (f->pins == 0 && f->state == frame_state::resident && !skip.count(f->pid)) {
					return f;
				}
			}
			return nullptr;
		}

		void evict_frame(frame* f) {
			STRATA_ASSERT(f->pins == 0, "Trying to evict a pinned page");
			STRATA_LOG_DEBUG("cache", "evict page ", f->pid);
			pop_frame_from_list(f);
			frames_.erase(f->pid);
			++stats_.evictions;
			cv_.notify_all();
		}

		void write_back_locked(page_type& pg) {
			const auto seq = write_seq_.fetch_add(1, std::memory_order_acq_rel) + 1;
			auto bytes = codec_type::encode(pg, seq);
			pg.clear_dirty();
			try {
				storage::with_retry(cfg_.retry, "write", pg.id(), [&] {
					return store_->write_page(pg.id(), bytes);
				});
			}
			catch (...) {
				pg.mark_dirty();
				throw;
			}
			pg.set_write_seq(seq);
			pg.set_size_bytes(bytes.size());
			std::lock_guard<std::mutex> lck(mutex_);
			++stats_.writes;
		}

		// LRU list: first_used_ is the most recent, last_used_ the victim end.
		void push_frame_used(frame* s) {
			s->prev = nullptr;
			s->next = first_used_;
			if (first_used_) {
				first_used_->prev = s;
			}
			first_used_ = s;
			if (nullptr == last_used_) {
				last_used_ = s;
			}
		}

		void push_frame_unused(frame* s) {
			s->next = nullptr;
			s->prev = last_used_;
			if (last_used_) {
				last_used_->next = s;
			}
			last_used_ = s;
			if (nullptr == first_used_) {
				first_used_ = s;
			}
		}

		void pop_frame_from_list(frame* s) {
			auto next = s->next;
			auto prev = s->prev;
			if (next) {
				next->prev = prev;
			}
			if (prev) {
				prev->next = next;
			}
			if (s == first_used_) {
				first_used_ = next;
			}
			if (s == last_used_) {
				last_used_ = prev;
			}
			s->next = s->prev = nullptr;
		}

		void touch(frame* s) {
			if (s != first_used_) {
				pop_frame_from_list(s);
				push_frame_used(s);
			}
		}

		store_type* store_ = nullptr;
		cache_config cfg_;
		mutable std::mutex mutex_;
		std::condition_variable cv_;
		std::unordered_map<page_id, std::unique_ptr<frame>> frames_;
		std::unordered_set<page_id> retired_;
		std::unordered_set<page_id> quarantined_;
		frame* first_used_ = nullptr;
		frame* last_used_ = nullptr;
		std::atomic<std::uint64_t> write_seq_{ 0 };
		cache_stats stats_;
	};

} // namespace strata::cache
