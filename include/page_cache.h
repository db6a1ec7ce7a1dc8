/*
 * HoloDSM page cache
 *
 * Node-local 2Q cache of remote pages. New entries enter the "once" list;
 * a second touch promotes them to the front of the "frequent" list. Eviction
 * takes the back of "once" first and only falls back to the back of
 * "frequent" when "once" is empty. Cache membership carries no lease state.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_PAGE_CACHE_H
#define HOLODSM_PAGE_CACHE_H

#include "dsm_types.h"
#include "page.h"
#include <atomic>
#include <list>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

class PageCache {
public:
    explicit PageCache(size_t capacity);

    PageCache(const PageCache &) = delete;
    PageCache &operator=(const PageCache &) = delete;

    // Returns nullptr on miss; a hit updates recency/promotion
    std::shared_ptr<Page> get(const ArrayID &array_id, PageID page_id);
    void put(const ArrayID &array_id, PageID page_id, std::shared_ptr<Page> page);
    bool remove(const ArrayID &array_id, PageID page_id);
    size_t remove_array(const ArrayID &array_id);

    // No side effects on ordering
    bool contains(const ArrayID &array_id, PageID page_id) const;
    bool in_frequent(const ArrayID &array_id, PageID page_id) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

    // Keys from most to least recently used, for diagnostics
    std::vector<PageKey> once_keys() const;
    std::vector<PageKey> frequent_keys() const;

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t insertions;
        uint64_t promotions;
        uint64_t evictions;
    };
    Stats get_stats() const;

private:
    struct CacheEntry {
        PageKey key;
        std::shared_ptr<Page> page;
        bool from_frequent;
    };
    using EntryList = std::list<CacheEntry>;

    // Caller holds mutex_ exclusively
    void touch_locked(EntryList::iterator it);
    void evict_locked();

    size_t capacity_;
    EntryList once_list_;
    EntryList frequent_list_;
    std::unordered_map<PageKey, EntryList::iterator, PageKeyHash> index_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> total_hits_{0};
    std::atomic<uint64_t> total_misses_{0};
    std::atomic<uint64_t> total_insertions_{0};
    std::atomic<uint64_t> total_promotions_{0};
    std::atomic<uint64_t> total_evictions_{0};
};

#endif // HOLODSM_PAGE_CACHE_H
