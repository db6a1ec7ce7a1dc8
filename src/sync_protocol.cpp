/*
 * HoloDSM sync barrier implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "sync_protocol.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::vector<SyncBarrier::WorkingEntry> SyncBarrier::collect_working(const ArrayID &array_id) {
    std::vector<WorkingEntry> working;
    std::lock_guard<std::mutex> lock(manager_.working_mutex_);
    for (const auto &entry : manager_.working_set_) {
        if (entry.first.array_id == array_id) {
            working.emplace_back(entry.first.page_id, entry.second);
        }
    }
    return working;
}

DsmStatus SyncBarrier::flush_page(const DsmContext &ctx, DsmArray &array, PageID page_id,
                                  MemoryManager::WorkingPage &wp, Version version) {
    bool renew = wp.lease.expired(DsmClock::now());
    if (!renew) {
        Lease current;
        DsmError err = manager_.validate_at_home(ctx, array, wp.lease.id, current);
        if (err == DsmError::NOT_FOUND || err == DsmError::EXPIRED) {
            renew = true;
        } else if (err != DsmError::OK) {
            return report_failure(DsmStatus::failure(err, array.id(), page_id, "write lease could not be confirmed",
                                                     wp.lease.id));
        }
    }

    NodeID owner;
    if (!array.page_owner(page_id, owner)) {
        // The owner left the cluster; re-acquiring claims the page for us
        renew = true;
    }
    if (renew) {
        DsmError err = manager_.renew_write_lease(ctx, array, page_id, wp);
        if (err != DsmError::OK) {
            return report_failure(
                DsmStatus::failure(err, array.id(), page_id, "write lease lost before flush", wp.lease.id));
        }
        if (!array.page_owner(page_id, owner)) {
            return report_failure(DsmStatus::failure(DsmError::PROTOCOL, array.id(), page_id,
                                                     "page still has no owner after renewal", wp.lease.id));
        }
    }

    if (owner == manager_.local_node()) {
        auto page = manager_.local_page(array, page_id);
        if (page != wp.page) {
            std::vector<uint8_t> bytes = wp.page->snapshot();
            DsmError err = page->load(bytes.data(), bytes.size());
            if (err != DsmError::OK) {
                return report_failure(
                    DsmStatus::failure(err, array.id(), page_id, "working copy does not fit the page", wp.lease.id));
            }
        }
        page->set_version(version);
        page->mark_clean();
    } else {
        DsmMessage req;
        req.type = DSM_MSG_PAGE_PUSH;
        req.array_id = array.id();
        req.page_id = page_id;
        req.version = version;
        req.lease_id = wp.lease.id;
        req.page_data = wp.page->snapshot();

        DsmMessage resp;
        DsmError err = manager_.call(ctx, owner, req, resp);
        if (err != DsmError::OK) {
            return report_failure(
                DsmStatus::failure(err, array.id(), page_id, fmt::format("push to {} failed", owner), wp.lease.id));
        }
        manager_.total_pages_pushed_++;
    }

    wp.page->set_version(version);
    wp.page->mark_clean();
    return DsmStatus::success();
}

DsmStatus SyncBarrier::flush(const DsmContext &ctx, DsmArray &array, std::vector<WorkingEntry> &working,
                             Version version, SyncReport &report) {
    for (auto &[page_id, wp] : working) {
        DsmError err = ctx.check();
        if (err != DsmError::OK) {
            return report_failure(DsmStatus::failure(err, array.id(), page_id, "sync interrupted during flush"));
        }
        if (!wp.page->dirty()) {
            continue;
        }
        DsmStatus status = flush_page(ctx, array, page_id, wp, version);
        if (!status.ok()) {
            return status;
        }
        report.pages_flushed++;
    }
    return DsmStatus::success();
}

void SyncBarrier::release(const DsmContext &ctx, DsmArray &array, const std::vector<WorkingEntry> &working,
                          SyncReport &report) {
    {
        std::lock_guard<std::mutex> lock(manager_.working_mutex_);
        for (const auto &entry : working) {
            manager_.working_set_.erase(PageKey{array.id(), entry.first});
        }
    }

    for (const auto &[page_id, wp] : working) {
        DsmError err = manager_.release_at_home(ctx, array, wp.lease.id);
        if (err == DsmError::OK) {
            report.leases_released++;
        } else if (err == DsmError::NOT_FOUND || err == DsmError::EXPIRED) {
            SPDLOG_DEBUG("Write lease {} on array {} page {} already gone", wp.lease.id, array.id(), page_id);
        } else {
            SPDLOG_WARN("Write lease {} on array {} page {} left to expire: {}", wp.lease.id, array.id(), page_id,
                        dsm_error_string(err));
        }
    }
    report.leases_released += manager_.release_read_pins(ctx, array);
}

void SyncBarrier::invalidate(const DsmContext &ctx, DsmArray &array, const std::set<PageID> &touched, Version version,
                             SyncReport &report) {
    manager_.drop_cached_pages(array, std::vector<PageID>(touched.begin(), touched.end()));
    std::vector<std::pair<PageID, NodeID>> owners;
    for (PageID page_id : touched) {
        NodeID owner;
        if (!array.page_owner(page_id, owner)) {
            owner.clear();
        }
        owners.emplace_back(page_id, owner);
    }
    report.pages_invalidated = touched.size();

    if (!manager_.transport_) {
        return;
    }
    for (const auto &peer : manager_.transport_->peers()) {
        DsmMessage req;
        req.type = DSM_MSG_INVALIDATE;
        req.array_id = array.id();
        req.version = version;
        req.owners = owners;

        DsmMessage resp;
        DsmError err = manager_.call(ctx, peer, req, resp);
        if (err == DsmError::OK) {
            report.peers_notified++;
            manager_.total_invalidations_sent_++;
        } else {
            report.peers_unreachable++;
            SPDLOG_WARN("Peer {} missed invalidation of array {} version {}: {}", peer, array.id(), version,
                        dsm_error_string(err));
        }
    }
}

DsmStatus SyncBarrier::run(const DsmContext &ctx, const ArrayID &array_id, SyncReport *report) {
    auto array = manager_.get_array(array_id);
    if (!array) {
        return report_failure(DsmStatus::failure(DsmError::NOT_FOUND, array_id, -1, "sync of unknown array"));
    }
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return report_failure(DsmStatus::failure(err, array_id, -1, "sync interrupted before it began"));
    }

    SyncReport scratch;
    SyncReport &rep = report ? *report : scratch;
    rep = SyncReport();

    std::unique_lock<std::shared_mutex> phase(array->phase_mutex());
    const Version version = array->version() + 1;

    array->set_sync_state(SyncState::FLUSHING);
    std::vector<WorkingEntry> working = collect_working(array_id);
    DsmStatus status = flush(ctx, *array, working, version, rep);
    if (!status.ok()) {
        array->set_sync_state(SyncState::ACTIVE);
        return status;
    }

    // Flushed data is visible at the owners; finish without the caller's deadline
    DsmContext finish = DsmContext::background();
    array->set_sync_state(SyncState::INVALIDATING);
    release(finish, *array, working, rep);
    invalidate(finish, *array, array->take_touched(), version, rep);

    array->adopt_version(version);
    rep.version = array->version();
    array->set_sync_state(SyncState::SYNCED);
    manager_.total_syncs_completed_++;

    SPDLOG_INFO("Sync of array {} on {} complete: version {}, {} page(s) flushed, {} lease(s) released, "
                "{} peer(s) notified, {} unreachable",
                array_id, manager_.local_node(), rep.version, rep.pages_flushed, rep.leases_released,
                rep.peers_notified, rep.peers_unreachable);
    return DsmStatus::success();
}
