/*
 * HoloDSM array descriptor implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_array.h"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

const char *sync_state_string(SyncState state) {
    switch (state) {
    case SyncState::ACTIVE:
        return "ACTIVE";
    case SyncState::FLUSHING:
        return "FLUSHING";
    case SyncState::INVALIDATING:
        return "INVALIDATING";
    case SyncState::SYNCED:
        return "SYNCED";
    }
    return "UNKNOWN";
}

DsmArray::DsmArray(const ArrayID &id, uint64_t length, ElementType element_type, const NodeID &home_node,
                   size_t page_size)
    : id_(id), length_(length), element_type_(element_type), home_node_(home_node), page_size_(page_size),
      num_pages_(0) {
    // Callers reject longer arrays; clamp so PageID never wraps
    uint64_t pages = compute_page_count(length, element_size(element_type), page_size);
    num_pages_ = static_cast<uint32_t>(std::min<uint64_t>(pages, std::numeric_limits<PageID>::max()));
}

uint64_t DsmArray::compute_page_count(uint64_t length, size_t elem_size, size_t page_size) {
    // Pages hold whole elements, so counting elements avoids overflowing the byte size
    uint64_t per_page = page_size / elem_size;
    return length / per_page + (length % per_page != 0 ? 1 : 0);
}

uint64_t DsmArray::max_length(size_t elem_size, size_t page_size) {
    return static_cast<uint64_t>(std::numeric_limits<PageID>::max()) * (page_size / elem_size);
}

DsmError DsmArray::locate(uint64_t index, PageID &page_id, int64_t &page_element) const {
    if (index >= length_) {
        return DsmError::OUT_OF_BOUNDS;
    }
    uint64_t per_page = elements_per_page();
    page_id = static_cast<PageID>(index / per_page);
    page_element = static_cast<int64_t>(index % per_page);
    return DsmError::OK;
}

bool DsmArray::page_owner(PageID page_id, NodeID &owner) const {
    std::shared_lock<std::shared_mutex> lock(owners_mutex_);
    auto it = page_owners_.find(page_id);
    if (it == page_owners_.end()) {
        return false;
    }
    owner = it->second;
    return true;
}

DsmError DsmArray::set_page_owner(PageID page_id, const NodeID &owner) {
    if (!valid_page(page_id)) {
        return DsmError::OUT_OF_BOUNDS;
    }
    std::unique_lock<std::shared_mutex> lock(owners_mutex_);
    page_owners_[page_id] = owner;
    return DsmError::OK;
}

NodeID DsmArray::claim_page_owner(PageID page_id, const NodeID &candidate) {
    std::unique_lock<std::shared_mutex> lock(owners_mutex_);
    auto [it, inserted] = page_owners_.emplace(page_id, candidate);
    if (inserted) {
        SPDLOG_DEBUG("Array {} page {} now owned by {}", id_, page_id, candidate);
    }
    return it->second;
}

std::vector<PageID> DsmArray::drop_owner(const NodeID &node) {
    std::vector<PageID> dropped;
    std::unique_lock<std::shared_mutex> lock(owners_mutex_);
    for (auto it = page_owners_.begin(); it != page_owners_.end();) {
        if (it->second == node) {
            dropped.push_back(it->first);
            it = page_owners_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

bool DsmArray::release_page_claim(PageID page_id, const NodeID &node) {
    std::unique_lock<std::shared_mutex> lock(owners_mutex_);
    auto it = page_owners_.find(page_id);
    if (it == page_owners_.end() || it->second != node) {
        return false;
    }
    page_owners_.erase(it);
    SPDLOG_DEBUG("Array {} page {} claim by {} withdrawn", id_, page_id, node);
    return true;
}

size_t DsmArray::mapped_pages() const {
    std::shared_lock<std::shared_mutex> lock(owners_mutex_);
    return page_owners_.size();
}

void DsmArray::adopt_version(Version v) {
    Version current = version_.load(std::memory_order_acquire);
    while (v > current && !version_.compare_exchange_weak(current, v, std::memory_order_acq_rel)) {
    }
}

void DsmArray::mark_touched(PageID page_id) {
    std::lock_guard<std::mutex> lock(touched_mutex_);
    touched_.insert(page_id);
}

std::set<PageID> DsmArray::take_touched() {
    std::lock_guard<std::mutex> lock(touched_mutex_);
    std::set<PageID> out;
    out.swap(touched_);
    return out;
}

size_t DsmArray::touched_count() const {
    std::lock_guard<std::mutex> lock(touched_mutex_);
    return touched_.size();
}

ArrayDescriptor DsmArray::describe() const {
    ArrayDescriptor desc;
    desc.id = id_;
    desc.length = length_;
    desc.element_type = element_type_;
    desc.home_node = home_node_;
    desc.version = version();
    std::shared_lock<std::shared_mutex> lock(owners_mutex_);
    desc.owners.assign(page_owners_.begin(), page_owners_.end());
    return desc;
}

void DsmArray::merge_owners(const std::vector<std::pair<PageID, NodeID>> &owners) {
    std::unique_lock<std::shared_mutex> lock(owners_mutex_);
    for (const auto &[page_id, owner] : owners) {
        if (!valid_page(page_id)) {
            SPDLOG_WARN("Ignoring owner entry for page {} outside array {} ({} pages)", page_id, id_, num_pages_);
            continue;
        }
        if (owner.empty()) {
            page_owners_.erase(page_id);
        } else {
            page_owners_[page_id] = owner;
        }
    }
}
