/*
 * HoloDSM page cache implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "page_cache.h"
#include <iterator>
#include <mutex>
#include <spdlog/spdlog.h>

PageCache::PageCache(size_t capacity) : capacity_(capacity) {
    SPDLOG_DEBUG("PageCache: capacity {} pages", capacity_);
}

void PageCache::touch_locked(EntryList::iterator it) {
    if (!it->from_frequent) {
        // Second touch proves reuse
        it->from_frequent = true;
        frequent_list_.splice(frequent_list_.begin(), once_list_, it);
        total_promotions_++;
    } else {
        frequent_list_.splice(frequent_list_.begin(), frequent_list_, it);
    }
}

void PageCache::evict_locked() {
    EntryList *victims = nullptr;
    if (!once_list_.empty()) {
        victims = &once_list_;
    } else if (!frequent_list_.empty()) {
        victims = &frequent_list_;
    } else {
        return;
    }

    auto victim = std::prev(victims->end());
    SPDLOG_DEBUG("Evicting array {} page {} from {} list", victim->key.array_id, victim->key.page_id,
                 victim->from_frequent ? "frequent" : "once");
    index_.erase(victim->key);
    victims->erase(victim);
    total_evictions_++;
}

std::shared_ptr<Page> PageCache::get(const ArrayID &array_id, PageID page_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(PageKey{array_id, page_id});
    if (it == index_.end()) {
        total_misses_++;
        return nullptr;
    }
    total_hits_++;
    touch_locked(it->second);
    return it->second->page;
}

void PageCache::put(const ArrayID &array_id, PageID page_id, std::shared_ptr<Page> page) {
    PageKey key{array_id, page_id};
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->page = std::move(page);
        touch_locked(it->second);
        return;
    }

    once_list_.push_front(CacheEntry{key, std::move(page), false});
    index_.emplace(std::move(key), once_list_.begin());
    total_insertions_++;

    while (index_.size() > capacity_) {
        evict_locked();
    }
}

bool PageCache::remove(const ArrayID &array_id, PageID page_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(PageKey{array_id, page_id});
    if (it == index_.end()) {
        return false;
    }
    if (it->second->from_frequent) {
        frequent_list_.erase(it->second);
    } else {
        once_list_.erase(it->second);
    }
    index_.erase(it);
    return true;
}

size_t PageCache::remove_array(const ArrayID &array_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = index_.begin(); it != index_.end();) {
        if (it->first.array_id != array_id) {
            ++it;
            continue;
        }
        if (it->second->from_frequent) {
            frequent_list_.erase(it->second);
        } else {
            once_list_.erase(it->second);
        }
        it = index_.erase(it);
        removed++;
    }
    return removed;
}

bool PageCache::contains(const ArrayID &array_id, PageID page_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.count(PageKey{array_id, page_id}) > 0;
}

bool PageCache::in_frequent(const ArrayID &array_id, PageID page_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(PageKey{array_id, page_id});
    return it != index_.end() && it->second->from_frequent;
}

size_t PageCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.size();
}

std::vector<PageKey> PageCache::once_keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PageKey> keys;
    for (const auto &entry : once_list_) {
        keys.push_back(entry.key);
    }
    return keys;
}

std::vector<PageKey> PageCache::frequent_keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PageKey> keys;
    for (const auto &entry : frequent_list_) {
        keys.push_back(entry.key);
    }
    return keys;
}

PageCache::Stats PageCache::get_stats() const {
    Stats stats;
    stats.hits = total_hits_.load();
    stats.misses = total_misses_.load();
    stats.insertions = total_insertions_.load();
    stats.promotions = total_promotions_.load();
    stats.evictions = total_evictions_.load();
    return stats;
}
