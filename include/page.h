/*
 * HoloDSM page
 *
 * A versioned, fixed-size chunk of an array. The storage buffer is guarded by
 * the page's own reader/writer lock; no other object mutates it.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_PAGE_H
#define HOLODSM_PAGE_H

#include "dsm_types.h"
#include "page_storage.h"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <vector>

class Page {
public:
    Page(const ArrayID &array_id, PageID page_id, Version version, size_t page_size = DSM_PAGE_SIZE);

    // Non-copyable; use clone() for a private working copy
    Page(const Page &) = delete;
    Page &operator=(const Page &) = delete;

    // Element-indexed accessors: 8 bytes per int64, 4 bytes per float32
    DsmError get_int64(int64_t element_index, int64_t &out) const;
    DsmError set_int64(int64_t element_index, int64_t value);
    DsmError get_float32(int64_t element_index, float &out) const;
    DsmError set_float32(int64_t element_index, float value);

    // Wire transfer of the full page
    DsmError load(const uint8_t *data, size_t size);
    std::vector<uint8_t> snapshot() const;
    std::shared_ptr<Page> clone() const;

    const ArrayID &array_id() const { return array_id_; }
    PageID page_id() const { return page_id_; }
    size_t size() const { return storage_.size(); }

    Version version() const { return version_.load(std::memory_order_acquire); }
    void set_version(Version v) { version_.store(v, std::memory_order_release); }

    // Set by writes, cleared once the contents reach the owner of record
    bool dirty() const { return dirty_.load(std::memory_order_acquire); }
    void mark_clean() { dirty_.store(false, std::memory_order_release); }
    void mark_dirty() { dirty_.store(true, std::memory_order_release); }

private:
    ArrayID array_id_;
    PageID page_id_;
    std::atomic<Version> version_;
    std::atomic<bool> dirty_{false};
    mutable std::shared_mutex mutex_;
    PageStorage storage_;
};

#endif // HOLODSM_PAGE_H
