/*
 * File: memory_store.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-08
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/storage/backing_store.hpp"

namespace strata::storage {

    // In-memory backing store. Survives store close/open as long as the
    // object lives, and can be told to fail the next N calls of an
    // operation for fault testing.
    class memory_store {
    public:
        enum class op { read, write, remove, list };

        bool is_open() const noexcept { return true; }

        io_status read_page(page_id pid, core::byte_buffer& out) {
            std::lock_guard<std::mutex> lck(mutex_);
            ++reads_;
            if (auto st = take_fault(op::read); st != io_status::ok) {
                return st;
            }
            auto itr = pages_.find(pid);
            if (itr == pages_.end()) {
                return io_status::not_found;
            }
            out = itr->second;
            return io_status::ok;
        }

        io_status write_page(page_id pid, core::byte_view in) {
            std::lock_guard<std::mutex> lck(mutex_);
            ++writes_;
            if (auto st = take_fault(op::write); st != io_status::ok) {
                return st;
            }
            pages_[pid] = core::to_buffer(in);
            return io_status::ok;
        }

        io_status delete_page(page_id pid) {
            std::lock_guard<std::mutex> lck(mutex_);
            if (auto st = take_fault(op::remove); st != io_status::ok) {
                return st;
            }
            return pages_.erase(pid) ? io_status::ok : io_status::not_found;
        }

        io_status list_pages(std::vector<page_id>& ids) {
            std::lock_guard<std::mutex> lck(mutex_);
            if (auto st = take_fault(op::list); st != io_status::ok) {
                return st;
            }
            ids.clear();
            for (const auto& kv : pages_) {
                ids.push_back(kv.first);
            }
            return io_status::ok;
        }

        // After `after` more successful calls, the next `count` calls of
        // `o` return `status`.
        void inject(op o, io_status status, std::size_t count = 1, std::size_t after = 0) {
            std::lock_guard<std::mutex> lck(mutex_);
            faults_[o] = { status, after, count };
        }

        void clear_faults() {
            std::lock_guard<std::mutex> lck(mutex_);
            faults_.clear();
        }

        // Direct record access for tests that tamper with the medium.
        bool contains(page_id pid) const {
            std::lock_guard<std::mutex> lck(mutex_);
            return pages_.count(pid) > 0;
        }

        core::byte_buffer raw(page_id pid) const {
            std::lock_guard<std::mutex> lck(mutex_);
            auto itr = pages_.find(pid);
            return itr == pages_.end() ? core::byte_buffer{} : itr->second;
        }

        void put_raw(page_id pid, core::byte_buffer data) {
            std::lock_guard<std::mutex> lck(mutex_);
            pages_[pid] = std::move(data);
        }

        std::size_t pages_count() const {
            std::lock_guard<std::mutex> lck(mutex_);
            return pages_.size();
        }

        std::uint64_t reads() const {
            std::lock_guard<std::mutex> lck(mutex_);
            return reads_;
        }

        std::uint64_t writes() const {
            std::lock_guard<std::mutex> lck(mutex_);
            return writes_;
        }

    private:
        struct fault {
            io_status status = io_status::ok;
            std::size_t skip = 0;
            std::size_t remaining = 0;
        };

        io_status take_fault(op o) {
            auto itr = faults_.find(o);
            if (itr == faults_.end() || itr->second.remaining == 0) {
                return io_status::ok;
            }
            if (itr->second.skip > 0) {
                --itr->second.skip;
                return io_status::ok;
            }
            --itr->second.remaining;
            return itr->second.status;
        }

        mutable std::mutex mutex_;
        std::map<page_id, core::byte_buffer> pages_;
        std::map<op, fault> faults_;
        std::uint64_t reads_ = 0;
        std::uint64_t writes_ = 0;
    };

    static_assert(BackingStore<memory_store>);

} // namespace strata::storage
