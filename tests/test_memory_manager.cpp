/*
 * Test: single-node memory manager
 *
 * Runs the engine without a transport and verifies array lifecycle, page
 * resolution, lease routing to the local authority, element access through
 * shared array handles, the local Sync path and configuration handling.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_config.h"
#include "memory_manager.h"
#include "shared_array.h"
#include "test_common.h"
#include <cstdlib>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== HoloDSM Memory Manager Test ===" << std::endl;
    TestResult results;
    const DsmContext ctx = DsmContext::background();

    phase("Phase 1: Configuration");
    {
        PeerConfig peer;
        results.check(parse_peer("node-b=10.0.0.2:9901", peer) == DsmError::OK, "Peer entry parses");
        results.check(peer.id == "node-b" && peer.host == "10.0.0.2" && peer.port == 9901, "Peer fields");
        results.check(parse_peer("node-b@10.0.0.2", peer) == DsmError::INVALID_ARGUMENT, "Missing '=' rejected");
        results.check(parse_peer("node-b=10.0.0.2:0", peer) == DsmError::INVALID_ARGUMENT, "Port 0 rejected");
        results.check(parse_peer("node-b=host:99999", peer) == DsmError::INVALID_ARGUMENT, "Port overflow rejected");

        setenv("HOLODSM_NODE_ID", "env-node", 1);
        setenv("HOLODSM_CACHE_MB", "2", 1);
        setenv("HOLODSM_LEASE_TTL_MS", "250", 1);
        setenv("HOLODSM_REQUEST_TIMEOUT_MS", "bogus", 1);
        DsmConfig config;
        config.apply_env();
        results.check(config.node_id == "env-node", "Node id from the environment");
        results.check(config.cache_capacity_pages == 32, "2 MiB of cache is 32 pages");
        results.check(config.lease_ttl == 250ms, "Lease TTL from the environment");
        results.check(config.request_timeout == 5000ms, "Malformed value leaves the default");

        setenv("HOLODSM_CACHE_PAGES", "7", 1);
        config.apply_env();
        results.check(config.cache_capacity_pages == 7, "Page count wins over the byte budget");
        unsetenv("HOLODSM_NODE_ID");
        unsetenv("HOLODSM_CACHE_MB");
        unsetenv("HOLODSM_CACHE_PAGES");
        unsetenv("HOLODSM_LEASE_TTL_MS");
        unsetenv("HOLODSM_REQUEST_TIMEOUT_MS");

        results.check(config.validate() == DsmError::OK, "Environment config validates");
        config.peers.push_back(PeerConfig{"env-node", "127.0.0.1", 9900});
        results.check(config.validate() == DsmError::INVALID_ARGUMENT, "Self as a peer rejected");
        DsmConfig zero;
        zero.lease_ttl = 0ms;
        results.check(zero.validate() == DsmError::INVALID_ARGUMENT, "Zero lease TTL rejected");

        DsmConfig bad;
        bad.node_id.clear();
        MemoryManager manager(bad);
        results.check(manager.start() == DsmError::INVALID_ARGUMENT, "Manager refuses an invalid config");
    }

    DsmConfig config;
    config.node_id = "solo";
    config.cache_capacity_pages = 16;
    MemoryManager manager(config);
    results.check(manager.start() == DsmError::OK && manager.running(), "Single-node manager started");

    phase("Phase 2: Array lifecycle and page resolution");
    std::shared_ptr<DsmArray> array;
    {
        DsmStatus status = manager.create_array(ctx, 20000, ElementType::INT64, array);
        results.check(status.ok() && array != nullptr, "Array created");
        results.check(array->home_node() == "solo" && array->num_pages() == 3, "Array is homed here with 3 pages");
        results.check(manager.get_array(array->id()) == array, "Array is registered");
        results.check(manager.array_count() == 1, "One array known");

        std::shared_ptr<DsmArray> huge;
        status = manager.create_array(ctx, 1ULL << 61, ElementType::INT64, huge);
        results.check(status.code == DsmError::INVALID_ARGUMENT && huge == nullptr,
                      "Array too long for page ids is rejected");
        status = manager.create_array(ctx, DsmArray::max_length(4) + 1, ElementType::FLOAT32, huge);
        results.check(status.code == DsmError::INVALID_ARGUMENT, "One element past the limit is rejected");
        results.check(manager.array_count() == 1, "Rejected arrays are not registered");

        std::shared_ptr<Page> page;
        status = manager.request_page(ctx, array->id(), 0, 0, page);
        results.check(status.code == DsmError::NOT_FOUND, "Unmapped page is NOT_FOUND");
        status = manager.request_page(ctx, array->id(), 3, 0, page);
        results.check(status.code == DsmError::OUT_OF_BOUNDS, "Page past the array is OUT_OF_BOUNDS");
        status = manager.request_page(ctx, "missing", 0, 0, page);
        results.check(status.code == DsmError::NOT_FOUND && status.array_id == "missing",
                      "Unknown array is NOT_FOUND with its identity");

        int64_t value = -1;
        status = manager.get_int64(ctx, array->id(), 100, value);
        results.check(status.ok() && value == 0, "Never-written element reads as zero");

        status = manager.set_int64(ctx, array->id(), 100, 42);
        results.check(status.ok(), "Write claims page 0");
        NodeID owner;
        results.check(array->page_owner(0, owner) && owner == "solo", "This node owns page 0");

        std::shared_ptr<Page> first, second;
        manager.request_page(ctx, array->id(), 0, 0, first);
        manager.request_page(ctx, array->id(), 0, 0, second);
        results.check(first != nullptr && first == second, "Local materialization is idempotent");
        results.check(first->get_int64(100, value) == DsmError::OK && value == 42, "Local page holds the write");
        results.check(manager.get_int64(ctx, array->id(), 100, value).ok() && value == 42, "Read back 42");
    }

    phase("Phase 3: Element access errors");
    {
        int64_t value = 0;
        float f = 0.0f;
        results.check(manager.get_int64(ctx, array->id(), 20000, value).code == DsmError::OUT_OF_BOUNDS,
                      "Index == length is OUT_OF_BOUNDS");
        results.check(manager.get_float32(ctx, array->id(), 0, f).code == DsmError::INVALID_ARGUMENT,
                      "Reading int64 elements as float32 is INVALID_ARGUMENT");
        results.check(manager.set_float32(ctx, array->id(), 0, 1.0f).code == DsmError::INVALID_ARGUMENT,
                      "Writing float32 into an int64 array is INVALID_ARGUMENT");

        auto flag = std::make_shared<std::atomic<bool>>(true);
        DsmContext cancelled;
        cancelled.attach_cancel_flag(flag);
        results.check(manager.set_int64(cancelled, array->id(), 0, 1).code == DsmError::CANCELLED,
                      "Cancelled context is honoured before any work");
    }

    phase("Phase 4: Leases through the local authority");
    {
        Lease lease;
        DsmStatus status = manager.acquire_lease(ctx, array->id(), 0, LeaseType::WRITE, lease);
        results.check(status.code == DsmError::CONFLICT, "Pending write holds the page's write lease");

        status = manager.acquire_lease(ctx, array->id(), 1, LeaseType::READ, lease);
        results.check(status.ok() && lease.owner == "solo", "Read lease on another page granted");
        Lease current;
        results.check(manager.validate_lease(ctx, array->id(), lease.id, current).ok(), "Lease validates");
        results.check(manager.release_lease(ctx, array->id(), lease.id).ok(), "Lease released");
        results.check(manager.validate_lease(ctx, array->id(), lease.id, current).code == DsmError::NOT_FOUND,
                      "Released lease is gone");
        results.check(manager.acquire_lease(ctx, array->id(), 7, LeaseType::READ, lease).code ==
                          DsmError::OUT_OF_BOUNDS,
                      "Lease on a page past the array is OUT_OF_BOUNDS");
    }

    phase("Phase 5: Local Sync");
    {
        results.check(manager.has_pending_writes(array->id()), "Write is pending");
        manager.set_int64(ctx, array->id(), 9000, 7);

        SyncReport report;
        DsmStatus status = manager.sync(ctx, array->id(), &report);
        results.check(status.ok(), "Sync succeeded");
        results.check(report.pages_flushed == 2, "Two dirty pages flushed");
        results.check(report.leases_released == 2, "Two write leases released");
        results.check(report.pages_invalidated == 2, "Two touched pages invalidated");
        results.check(report.peers_notified == 0 && report.peers_unreachable == 0, "No peers to notify");
        results.check(report.version == 2 && array->version() == 2, "Array advanced to version 2");
        results.check(array->sync_state() == SyncState::SYNCED, "Array is SYNCED");
        results.check(!manager.has_pending_writes(array->id()), "Nothing pending after Sync");
        results.check(manager.leases().lease_count() == 0, "No leases left");

        int64_t value = 0;
        results.check(manager.get_int64(ctx, array->id(), 9000, value).ok() && value == 7, "Flushed value visible");

        Lease lease;
        results.check(manager.acquire_lease(ctx, array->id(), 0, LeaseType::WRITE, lease).ok(),
                      "Page 0 is writable by others after Sync");
        results.check(manager.revoke_lease(ctx, array->id(), 0).ok(), "Revoke clears it");
        results.check(manager.leases().lease_count() == 0, "Revoke removed the lease");

        manager.set_int64(ctx, array->id(), 1, 5);
        results.check(array->sync_state() == SyncState::ACTIVE, "A write after Sync returns the array to ACTIVE");
        results.check(manager.sync(ctx, array->id()).ok() && array->version() == 3, "Second Sync bumps again");
        results.check(manager.get_stats().syncs_completed == 2, "Two syncs counted");
        results.check(manager.sync(ctx, "missing").code == DsmError::NOT_FOUND, "Sync of an unknown array");
    }

    phase("Phase 6: Shared array handles");
    {
        std::unique_ptr<SharedArray> handle;
        DsmStatus status = SharedArray::create(manager, ctx, 10, ElementType::FLOAT32, ArrayPolicy(), handle);
        results.check(status.ok() && handle->length() == 10, "Float array handle created");
        results.check(handle->set_float32(ctx, 3, 1.5f).ok(), "Handle write");

        SharedArray view = handle->slice(2, 6);
        float f = 0.0f;
        results.check(view.length() == 4 && view.offset() == 2, "Slice covers [2, 6)");
        results.check(view.get_float32(ctx, 1, f).ok() && f == 1.5f, "Slice index 1 is array index 3");
        results.check(view.get_float32(ctx, 4, f).code == DsmError::OUT_OF_BOUNDS, "Slice bounds enforced");
        SharedArray clamped = handle->slice(8, 50);
        results.check(clamped.length() == 2, "Slice end clamps to the array");
        SharedArray inverted = handle->slice(7, 3);
        results.check(inverted.length() == 0, "Inverted slice is empty");

        int64_t value = 0;
        results.check(handle->get_int64(ctx, 0, value).code == DsmError::INVALID_ARGUMENT,
                      "Type mismatch through a handle");

        results.check(handle->close(ctx).ok(), "Close with pending writes");
        auto closed = manager.get_array(handle->id());
        results.check(closed->version() == 2 && !manager.has_pending_writes(handle->id()), "Close synced the write");
        results.check(handle->closed() && handle->close(ctx).ok(), "Close is idempotent");
        results.check(handle->set_float32(ctx, 0, 1.0f).code == DsmError::INVALID_ARGUMENT,
                      "Closed handle rejects access");

        std::unique_ptr<SharedArray> reopened;
        status = SharedArray::open(manager, ctx, handle->id(), "solo", ArrayPolicy(), reopened);
        results.check(status.ok() && reopened->get_float32(ctx, 3, f).ok() && f == 1.5f,
                      "Reopened handle sees the synced value");
        status = SharedArray::open(manager, ctx, "missing", "solo", ArrayPolicy(), reopened);
        results.check(status.code == DsmError::NOT_FOUND, "Opening an unknown local array fails");
    }

    phase("Phase 7: Deletion and protocol errors");
    {
        manager.set_int64(ctx, array->id(), 5, 5);
        results.check(manager.delete_array(ctx, array->id()).ok(), "Array deleted");
        results.check(manager.get_array(array->id()) == nullptr, "Deleted array is gone");
        results.check(manager.leases().lease_count() == 0, "Deletion revoked its leases");
        results.check(manager.delete_array(ctx, array->id()).code == DsmError::NOT_FOUND,
                      "Deleting an unknown array is NOT_FOUND");
        int64_t value = 0;
        results.check(manager.get_int64(ctx, array->id(), 0, value).code == DsmError::NOT_FOUND,
                      "Access after deletion is NOT_FOUND");

        DsmMessage req;
        req.type = DSM_MSG_PAGE_PUSH_ACK;
        req.src_node = "peer";
        DsmMessage resp;
        manager.handle_message(req, resp);
        results.check(resp.status == DsmError::PROTOCOL, "Unexpected message type answered with PROTOCOL");

        req.type = DSM_MSG_INVALIDATE;
        req.array_id = "never-opened";
        manager.handle_message(req, resp);
        results.check(resp.status == DsmError::OK, "Invalidate of an unknown array is acknowledged");
    }

    manager.stop();
    results.check(!manager.running(), "Manager stopped");

    return results.summary();
}
