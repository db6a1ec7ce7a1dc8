/*
 * HoloDSM array descriptor
 *
 * An ordered collection of pages with a page -> owner map and a version that
 * only a completed Sync advances. Page bytes are not held here.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_DSM_ARRAY_H
#define HOLODSM_DSM_ARRAY_H

#include "dsm_types.h"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

/* Sync barrier states, per array */
enum class SyncState : uint8_t {
    ACTIVE = 0,
    FLUSHING = 1,
    INVALIDATING = 2,
    SYNCED = 3,
};

const char *sync_state_string(SyncState state);

/* Wire/introspection form of an array */
struct ArrayDescriptor {
    ArrayID id;
    uint64_t length = 0;
    ElementType element_type = ElementType::INT64;
    NodeID home_node;
    Version version = 1;
    std::vector<std::pair<PageID, NodeID>> owners;
};

class DsmArray {
public:
    DsmArray(const ArrayID &id, uint64_t length, ElementType element_type, const NodeID &home_node,
             size_t page_size = DSM_PAGE_SIZE);

    static uint64_t compute_page_count(uint64_t length, size_t elem_size, size_t page_size = DSM_PAGE_SIZE);
    // Longest array whose pages are all addressable by PageID
    static uint64_t max_length(size_t elem_size, size_t page_size = DSM_PAGE_SIZE);

    const ArrayID &id() const { return id_; }
    uint64_t length() const { return length_; }
    ElementType element_type() const { return element_type_; }
    size_t elem_size() const { return element_size(element_type_); }
    uint32_t num_pages() const { return num_pages_; }
    size_t page_size() const { return page_size_; }
    size_t elements_per_page() const { return page_size_ / elem_size(); }
    const NodeID &home_node() const { return home_node_; }

    // Element index -> (page, element index within that page)
    DsmError locate(uint64_t index, PageID &page_id, int64_t &page_element) const;
    bool valid_page(PageID page_id) const { return page_id >= 0 && static_cast<uint32_t>(page_id) < num_pages_; }

    /* Ownership map */
    bool page_owner(PageID page_id, NodeID &owner) const;
    DsmError set_page_owner(PageID page_id, const NodeID &owner);
    // Assigns `candidate` only if the page is unmapped; returns the resulting owner
    NodeID claim_page_owner(PageID page_id, const NodeID &candidate);
    // Unmaps every page owned by `node`, returning those pages
    std::vector<PageID> drop_owner(const NodeID &node);
    // Unmaps the page only while `node` still owns it
    bool release_page_claim(PageID page_id, const NodeID &node);
    size_t mapped_pages() const;

    /* Versioning */
    Version version() const { return version_.load(std::memory_order_acquire); }
    // Moves forward only
    void adopt_version(Version v);

    /*
     * Bumped by every invalidation. A remote page is cached only if no
     * invalidation landed while it was being fetched.
     */
    uint64_t fill_epoch() const { return fill_epoch_.load(std::memory_order_acquire); }
    void bump_fill_epoch() { fill_epoch_.fetch_add(1, std::memory_order_acq_rel); }

    /* Pages written since the last Sync */
    void mark_touched(PageID page_id);
    std::set<PageID> take_touched();
    size_t touched_count() const;

    SyncState sync_state() const { return sync_state_.load(std::memory_order_acquire); }
    void set_sync_state(SyncState state) { sync_state_.store(state, std::memory_order_release); }
    // Element access holds this shared; a Sync barrier holds it exclusively
    std::shared_mutex &phase_mutex() { return phase_mutex_; }

    ArrayDescriptor describe() const;
    void merge_owners(const std::vector<std::pair<PageID, NodeID>> &owners);

private:
    ArrayID id_;
    uint64_t length_;
    ElementType element_type_;
    NodeID home_node_;
    size_t page_size_;
    uint32_t num_pages_;

    std::map<PageID, NodeID> page_owners_;
    mutable std::shared_mutex owners_mutex_;

    std::atomic<Version> version_{1};
    std::atomic<uint64_t> fill_epoch_{0};

    std::set<PageID> touched_;
    mutable std::mutex touched_mutex_;

    std::atomic<SyncState> sync_state_{SyncState::ACTIVE};
    std::shared_mutex phase_mutex_;
};

#endif // HOLODSM_DSM_ARRAY_H
