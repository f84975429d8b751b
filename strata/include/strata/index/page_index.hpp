/*
 * File: page_index.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-21
 * License: MIT
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "strata/core/types.hpp"

namespace strata::index {

    using core::page_id;

    // Ordered first_key -> page_id routing table. The head page has an
    // unbounded lower fence and is kept outside the map, so every key
    // resolves to exactly one page.
    //
    // All methods take the internal lock for the duration of the map
    // operation only.
    template <typename KeyT, typename LessT = std::less<KeyT>>
    class page_index {
    public:
        using key_type = KeyT;
        using less_type = LessT;
        using map_type = std::map<KeyT, page_id, LessT>;
        using fence_type = std::optional<KeyT>;
        using entry_type = std::pair<fence_type, page_id>;

        explicit page_index(page_id head = core::invalid_page_id)
            : head_(head)
        {}

        page_index(const page_index&) = delete;
        page_index& operator = (const page_index&) = delete;

        void reset(page_id head, std::vector<std::pair<KeyT, page_id>> fences = {}) {
            std::unique_lock lck(mutex_);
            head_ = head;
            map_.clear();
            for (auto& [k, pid] : fences) {
                map_.emplace(std::move(k), pid);
            }
        }

        page_id head() const {
            std::shared_lock lck(mutex_);
            return head_;
        }

        // Predecessor search: the page whose fence is the greatest one <= key.
        page_id locate(const key_type& key) const {
            std::shared_lock lck(mutex_);
            auto itr = map_.upper_bound(key);
            if (itr == map_.begin()) {
                return head_;
            }
            return std::prev(itr)->second;
        }

        std::optional<page_id> find(const key_type& first_key) const {
            std::shared_lock lck(mutex_);
            if (auto itr = map_.find(first_key); itr != map_.end()) {
                return itr->second;
            }
            return std::nullopt;
        }

        // Page immediately left of the page fenced at first_key.
        page_id left_of(const key_type& first_key) const {
            std::shared_lock lck(mutex_);
            auto itr = map_.lower_bound(first_key);
            if (itr == map_.begin()) {
                return head_;
            }
            return std::prev(itr)->second;
        }

        entry_type last() const {
            std::shared_lock lck(mutex_);
            if (map_.empty()) {
                return { std::nullopt, head_ };
            }
            auto itr = std::prev(map_.end());
            return { itr->first, itr->second };
        }

        bool insert(const key_type& first_key, page_id pid) {
            std::unique_lock lck(mutex_);
            return map_.emplace(first_key, pid).second;
        }

        bool remove(const key_type& first_key) {
            std::unique_lock lck(mutex_);
            return map_.erase(first_key) > 0;
        }

        // Number of live pages, head included.
        std::size_t size() const {
            std::shared_lock lck(mutex_);
            return map_.size() + (head_ != core::invalid_page_id ? 1 : 0);
        }

        // Pages in key order, head first.
        std::vector<entry_type> snapshot() const {
            std::shared_lock lck(mutex_);
            std::vector<entry_type> out;
            out.reserve(map_.size() + 1);
            out.emplace_back(std::nullopt, head_);
            for (const auto& [k, pid] : map_) {
                out.emplace_back(k, pid);
            }
            return out;
        }

        std::vector<std::pair<KeyT, page_id>> fences() const {
            std::shared_lock lck(mutex_);
            return std::vector<std::pair<KeyT, page_id>>(map_.begin(), map_.end());
        }

    private:
        mutable std::shared_mutex mutex_;
        page_id head_;
        map_type map_;
    };

} // namespace strata::index
