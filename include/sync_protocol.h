/*
 * HoloDSM sync barrier
 *
 * Per-array state machine ACTIVE -> FLUSHING -> INVALIDATING -> SYNCED:
 *   1. Flush: dirty working pages go to their owner of record, under a
 *      write lease re-validated at the home node.
 *   2. Release: write leases and read pins this node holds on the array are
 *      returned to the home node.
 *   3. Invalidate: cached copies of pages touched since the last Sync are
 *      dropped here and on every reachable peer.
 *   4. Bump: the array version advances; only then is the Sync complete.
 * A failed flush aborts with the working pages intact and the array back in
 * ACTIVE. Cancellation is honoured until the flush completes.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_SYNC_PROTOCOL_H
#define HOLODSM_SYNC_PROTOCOL_H

#include "memory_manager.h"
#include <set>
#include <vector>

class SyncBarrier {
public:
    explicit SyncBarrier(MemoryManager &manager) : manager_(manager) {}

    DsmStatus run(const DsmContext &ctx, const ArrayID &array_id, SyncReport *report);

private:
    using WorkingEntry = std::pair<PageID, MemoryManager::WorkingPage>;

    std::vector<WorkingEntry> collect_working(const ArrayID &array_id);
    DsmStatus flush(const DsmContext &ctx, DsmArray &array, std::vector<WorkingEntry> &working, Version version,
                    SyncReport &report);
    DsmStatus flush_page(const DsmContext &ctx, DsmArray &array, PageID page_id, MemoryManager::WorkingPage &wp,
                         Version version);
    void release(const DsmContext &ctx, DsmArray &array, const std::vector<WorkingEntry> &working,
                 SyncReport &report);
    void invalidate(const DsmContext &ctx, DsmArray &array, const std::set<PageID> &touched, Version version,
                    SyncReport &report);

    MemoryManager &manager_;
};

#endif // HOLODSM_SYNC_PROTOCOL_H
