/*
 * HoloDSM memory manager
 *
 * Top-level coherence engine for one node. Creates and discovers arrays,
 * resolves page ownership, serves local pages, fetches remote pages through
 * the transport and routes lease traffic to each array's home node, which is
 * the lease authority and keeps the authoritative ownership map.
 *
 * The lease table and the page cache each carry their own lock and are
 * never locked together; a page may be cached without a valid lease.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_MEMORY_MANAGER_H
#define HOLODSM_MEMORY_MANAGER_H

#include "dsm_array.h"
#include "dsm_config.h"
#include "dsm_transport.h"
#include "dsm_types.h"
#include "lease_manager.h"
#include "membership_events.h"
#include "page.h"
#include "page_cache.h"
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

/* Per-handle access policy */
struct ArrayPolicy {
    // Reads of remote-owned pages hold a read lease until the next Sync/Close
    bool snapshot_reads = false;
};

/* Outcome of one Sync barrier */
struct SyncReport {
    Version version = 0;
    size_t pages_flushed = 0;
    size_t leases_released = 0;
    size_t pages_invalidated = 0;
    size_t peers_notified = 0;
    size_t peers_unreachable = 0;
};

class SyncBarrier;

class MemoryManager {
public:
    // A null transport runs the engine as a single-node cluster
    MemoryManager(const DsmConfig &config, DsmTransport *transport = nullptr);
    ~MemoryManager();

    MemoryManager(const MemoryManager &) = delete;
    MemoryManager &operator=(const MemoryManager &) = delete;

    DsmError start();
    void stop();
    bool running() const { return running_.load(); }

    /* Arrays */
    DsmStatus create_array(const DsmContext &ctx, uint64_t length, ElementType type, std::shared_ptr<DsmArray> &out);
    std::shared_ptr<DsmArray> get_array(const ArrayID &array_id) const;
    DsmStatus delete_array(const DsmContext &ctx, const ArrayID &array_id);
    // Learns an array created elsewhere from its home node
    DsmStatus open_array(const DsmContext &ctx, const ArrayID &array_id, const NodeID &home_node,
                         std::shared_ptr<DsmArray> &out);
    size_t array_count() const;

    /*
     * Resolves the owner from the array's page map. A local owner gets its
     * page materialized once and served; a remote owner is asked over the
     * transport and the copy cached. An unmapped page is NOT_FOUND: ownership
     * is claimed by acquiring a write lease first.
     */
    DsmStatus request_page(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, Version version,
                           std::shared_ptr<Page> &out);

    /* Leases, routed to the array's home node */
    DsmStatus acquire_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, LeaseType type,
                            Lease &out);
    DsmStatus release_lease(const DsmContext &ctx, const ArrayID &array_id, const LeaseID &lease_id);
    DsmStatus validate_lease(const DsmContext &ctx, const ArrayID &array_id, const LeaseID &lease_id, Lease &out);
    DsmStatus revoke_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id);

    /* Element access */
    DsmStatus get_int64(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, int64_t &out,
                        const ArrayPolicy &policy = ArrayPolicy());
    DsmStatus set_int64(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, int64_t value);
    DsmStatus get_float32(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, float &out,
                          const ArrayPolicy &policy = ArrayPolicy());
    DsmStatus set_float32(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, float value);

    /* Phase boundary */
    DsmStatus sync(const DsmContext &ctx, const ArrayID &array_id, SyncReport *report = nullptr);
    // Syncs outstanding writes, then drops every lease and cached page this node holds on the array
    DsmStatus close_array(const DsmContext &ctx, const ArrayID &array_id);
    // Pages written on this node since the last Sync
    bool has_pending_writes(const ArrayID &array_id) const;

    /* Membership */
    MemberEventChannel &member_events() { return member_events_; }
    // Drains queued events on the caller's thread
    size_t process_member_events();
    void handle_member_event(const MemberEvent &event);

    /* Inbound protocol entry point, installed as the transport handler */
    void handle_message(const DsmMessage &req, DsmMessage &resp);

    const NodeID &local_node() const { return config_.node_id; }
    const DsmConfig &config() const { return config_; }
    PageCache &cache() { return cache_; }
    LeaseManager &leases() { return leases_; }

    struct Stats {
        uint64_t local_reads;
        uint64_t remote_fetches;
        uint64_t remote_fetch_failures;
        uint64_t pages_pushed;
        uint64_t syncs_completed;
        uint64_t invalidations_sent;
        uint64_t invalidations_received;
    };
    Stats get_stats() const;

private:
    friend class SyncBarrier;

    // A page this node is writing under a write lease
    struct WorkingPage {
        std::shared_ptr<Page> page;
        Lease lease;
        // Owner's bytes when the private copy was taken; empty when the owned page is written in place
        std::vector<uint8_t> twin;
    };

    using PageAccessor = std::function<DsmError(Page &, int64_t)>;

    DsmStatus read_element(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, ElementType type,
                           const ArrayPolicy &policy, const PageAccessor &read);
    DsmStatus write_element(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, ElementType type,
                            const PageAccessor &write);

    // Applies the configured request timeout when `ctx` has no deadline
    DsmContext bounded(const DsmContext &ctx) const;
    DsmError call(const DsmContext &ctx, const NodeID &peer, DsmMessage &req, DsmMessage &resp);

    std::shared_ptr<Page> local_page(const DsmArray &array, PageID page_id);
    // Local storage for owned pages, cache then transport for the rest
    DsmError resolve_page(const DsmContext &ctx, const DsmArray &array, PageID page_id, Version version,
                          std::shared_ptr<Page> &out);
    DsmError fetch_remote_page(const DsmContext &ctx, const NodeID &owner, const DsmArray &array, PageID page_id,
                               Version version, std::shared_ptr<Page> &out);
    // Invalidates cached copies, including fetches still in flight
    void drop_cached_pages(DsmArray &array, const std::vector<PageID> &pages);

    // Authority side of lease acquisition; `page_owner` reports the owner after the grant
    DsmError grant_lease(const DsmContext &ctx, DsmArray &array, PageID page_id, LeaseType type,
                         const NodeID &requester, Version version, Lease &out, NodeID &page_owner,
                         const LeaseID &requested_id = LeaseID());
    DsmError acquire_at_home(const DsmContext &ctx, DsmArray &array, PageID page_id, LeaseType type, Lease &out,
                             NodeID &page_owner);
    DsmError release_at_home(const DsmContext &ctx, const DsmArray &array, const LeaseID &lease_id);
    // Withdraws an acquire whose grant never reached us
    void abandon_at_home(const DsmArray &array, PageID page_id, const LeaseID &token);
    DsmError validate_at_home(const DsmContext &ctx, const DsmArray &array, const LeaseID &lease_id, Lease &out);

    // Caller holds the page's acquire stripe
    DsmError open_working_page(const DsmContext &ctx, DsmArray &array, PageID page_id, WorkingPage &out);
    /*
     * Takes a fresh write lease for a working page whose lease lapsed. A
     * private copy is rebased onto the owner's current bytes, keeping only
     * the elements this node changed, so writes synced meanwhile survive.
     */
    DsmError renew_write_lease(const DsmContext &ctx, DsmArray &array, PageID page_id, WorkingPage &wp);
    DsmError pin_for_read(const DsmContext &ctx, DsmArray &array, PageID page_id);
    size_t release_read_pins(const DsmContext &ctx, const DsmArray &array);
    std::mutex &acquire_stripe(const PageKey &key);

    // Drops local pages, working copies and pins of an array, returning the leases they held
    std::vector<Lease> forget_array_state(const ArrayID &array_id);
    void member_event_loop();

    void on_page_request(const DsmMessage &req, DsmMessage &resp);
    void on_page_push(const DsmMessage &req, DsmMessage &resp);
    void on_lease_acquire(const DsmMessage &req, DsmMessage &resp);
    void on_lease_release(const DsmMessage &req, DsmMessage &resp);
    void on_lease_validate(const DsmMessage &req, DsmMessage &resp);
    void on_lease_revoke(const DsmMessage &req, DsmMessage &resp);
    void on_lease_abandon(const DsmMessage &req, DsmMessage &resp);
    void on_invalidate(const DsmMessage &req, DsmMessage &resp);
    void on_array_info(const DsmMessage &req, DsmMessage &resp);

    DsmConfig config_;
    DsmTransport *transport_;

    LeaseManager leases_;
    PageCache cache_;

    std::unordered_map<ArrayID, std::shared_ptr<DsmArray>> arrays_;
    mutable std::shared_mutex arrays_mutex_;

    // Pages this node owns, materialized on first access
    std::unordered_map<PageKey, std::shared_ptr<Page>, PageKeyHash> local_pages_;
    std::mutex local_pages_mutex_;

    std::unordered_map<PageKey, WorkingPage, PageKeyHash> working_set_;
    mutable std::mutex working_mutex_;

    // Read leases held for snapshot reads until the next Sync/Close
    std::unordered_map<PageKey, Lease, PageKeyHash> read_pins_;
    std::mutex pins_mutex_;

    // Orders cache fills against invalidations
    std::mutex fill_mutex_;

    // Home side: orders first-writer claims against abandoned acquires
    std::mutex claim_mutex_;
    // Abandon tokens that arrived before their acquire, with their expiry
    std::unordered_map<LeaseID, DsmClock::time_point> abandoned_;
    std::mutex abandoned_mutex_;

    static constexpr size_t ACQUIRE_STRIPES = 64;
    std::array<std::mutex, ACQUIRE_STRIPES> acquire_stripes_;

    MemberEventChannel member_events_;
    std::thread member_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> total_local_reads_{0};
    std::atomic<uint64_t> total_remote_fetches_{0};
    std::atomic<uint64_t> total_remote_fetch_failures_{0};
    std::atomic<uint64_t> total_pages_pushed_{0};
    std::atomic<uint64_t> total_syncs_completed_{0};
    std::atomic<uint64_t> total_invalidations_sent_{0};
    std::atomic<uint64_t> total_invalidations_received_{0};
};

// Logs a non-OK status once at WARN (retryable) or ERROR and returns it
DsmStatus report_failure(DsmStatus status);

#endif // HOLODSM_MEMORY_MANAGER_H
