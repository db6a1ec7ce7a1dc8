/*
 * HoloDSM lease manager
 *
 * Grants, validates, revokes and expires read/write leases keyed by
 * (array, page). Enforces single-writer/multi-reader per page:
 *   - an existing write lease rejects every new request
 *   - existing read leases reject a write request
 *   - read requests coexist; the same owner re-reading refreshes its lease
 * Expired leases are void on every check and purged by a periodic sweep.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_LEASE_MANAGER_H
#define HOLODSM_LEASE_MANAGER_H

#include "dsm_types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

struct Lease {
    LeaseID id;
    ArrayID array_id;
    PageID page_id = -1;
    LeaseType type = LeaseType::READ;
    std::string owner;
    DsmClock::time_point expires_at;
    Version version = 0;
    // Set at the home when this grant made the holder the page's first owner
    bool claimed_page = false;

    bool expired(DsmClock::time_point now) const { return now > expires_at; }
};

class LeaseManager {
public:
    explicit LeaseManager(std::chrono::milliseconds ttl);
    ~LeaseManager();

    LeaseManager(const LeaseManager &) = delete;
    LeaseManager &operator=(const LeaseManager &) = delete;

    /*
     * Conflicts fail immediately unless `ctx` carries a deadline, in which case
     * the call waits for the conflicting lease to go away until the deadline
     * (CONFLICT) or cancellation (CANCELLED). Nothing is created on failure.
     * A non-empty `requested_id` names the new lease, so a requester that
     * never saw the grant can still refer to it.
     */
    DsmError acquire_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, LeaseType type,
                           const std::string &owner, Version version, Lease &out,
                           const LeaseID &requested_id = LeaseID());
    DsmError release_lease(const LeaseID &lease_id);
    // Removes the lease whether or not it has expired, returning what was held
    DsmError take_lease(const LeaseID &lease_id, Lease &out);
    // Marks the lease as the one that claimed its page; false if it is gone
    bool note_page_claim(const LeaseID &lease_id);
    DsmError validate_lease(const LeaseID &lease_id, Lease &out) const;
    bool has_write_lease(const ArrayID &array_id, PageID page_id) const;

    // Clears every lease on the page; no-op when there is none
    DsmError revoke_lease(const ArrayID &array_id, PageID page_id);
    // Membership reported `owner` gone
    size_t revoke_leases_held_by(const std::string &owner);
    // Drops leases of `owner` on one array, optionally only one type
    size_t release_leases_for(const ArrayID &array_id, const std::string &owner, const LeaseType *type = nullptr);
    // Drops everything on an array (array deleted)
    size_t revoke_array(const ArrayID &array_id);

    size_t cleanup_expired_leases();

    /* Periodic sweep, independent of access patterns */
    void start_cleanup(std::chrono::milliseconds interval);
    void stop_cleanup();
    bool cleanup_running() const { return cleanup_running_.load(); }

    size_t lease_count() const;
    std::vector<Lease> leases_for(const ArrayID &array_id, PageID page_id) const;
    std::chrono::milliseconds ttl() const { return ttl_; }

    struct Stats {
        uint64_t granted;
        uint64_t refreshed;
        uint64_t conflicts;
        uint64_t released;
        uint64_t revoked;
        uint64_t expired;
    };
    Stats get_stats() const;

private:
    // Caller holds mutex_ exclusively
    void purge_expired_locked(const PageKey &key, DsmClock::time_point now);
    bool conflicts_locked(const PageKey &key, LeaseType type, DsmClock::time_point now) const;
    void erase_key_locked(const PageKey &key);
    void cleanup_loop(std::chrono::milliseconds interval);

    std::chrono::milliseconds ttl_;

    std::unordered_map<PageKey, std::vector<Lease>, PageKeyHash> leases_;
    std::unordered_map<LeaseID, PageKey> index_;
    mutable std::shared_mutex mutex_;
    // Signalled whenever a lease disappears, wakes waiting acquirers
    std::condition_variable_any released_cv_;

    std::thread cleanup_thread_;
    std::atomic<bool> cleanup_running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;

    std::atomic<uint64_t> total_granted_{0};
    std::atomic<uint64_t> total_refreshed_{0};
    std::atomic<uint64_t> total_conflicts_{0};
    std::atomic<uint64_t> total_released_{0};
    std::atomic<uint64_t> total_revoked_{0};
    std::atomic<uint64_t> total_expired_{0};
};

#endif // HOLODSM_LEASE_MANAGER_H
