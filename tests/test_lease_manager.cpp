/*
 * Test: lease table
 *
 * Verifies single-writer/multi-reader grants, TTL expiry, explicit release
 * and revoke, the periodic sweep, and waiting for a conflicting lease under
 * a deadline.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "lease_manager.h"
#include "test_common.h"
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <thread>

using namespace std::chrono_literals;

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== HoloDSM Lease Manager Test ===" << std::endl;
    TestResult results;
    const DsmContext ctx = DsmContext::background();

    phase("Phase 1: Readers share, writers exclude");
    {
        LeaseManager leases(5000ms);
        Lease r1, r2, w;
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-a", 1, r1) == DsmError::OK,
                      "First read lease granted");
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-b", 1, r2) == DsmError::OK,
                      "Second reader shares the page");
        results.check(r1.id != r2.id, "Distinct readers get distinct leases");
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-c", 1, w) == DsmError::CONFLICT,
                      "Write conflicts with readers");
        results.check(leases.lease_count() == 2, "Failed acquire creates nothing");

        results.check(leases.release_lease(r1.id) == DsmError::OK, "Release first reader");
        results.check(leases.release_lease(r2.id) == DsmError::OK, "Release second reader");
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-c", 1, w) == DsmError::OK,
                      "Write granted once readers are gone");
        results.check(leases.has_write_lease("arr", 0), "Writer is visible");

        Lease r3;
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-a", 1, r3) == DsmError::CONFLICT,
                      "Read conflicts with a writer");
        Lease w2;
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-c", 1, w2) == DsmError::CONFLICT,
                      "A second write lease conflicts even for the same owner");
        results.check(leases.acquire_lease(ctx, "arr", 1, LeaseType::WRITE, "node-a", 1, w2) == DsmError::OK,
                      "Other pages are independent");
        results.check(leases.acquire_lease(ctx, "other", 0, LeaseType::WRITE, "node-a", 1, w2) == DsmError::OK,
                      "Other arrays are independent");
    }

    phase("Phase 2: Same reader refreshes");
    {
        LeaseManager leases(5000ms);
        Lease first, again;
        leases.acquire_lease(ctx, "arr", 2, LeaseType::READ, "node-a", 1, first);
        std::this_thread::sleep_for(5ms);
        results.check(leases.acquire_lease(ctx, "arr", 2, LeaseType::READ, "node-a", 1, again) == DsmError::OK,
                      "Repeat read acquire succeeds");
        results.check(again.id == first.id, "Repeat read acquire returns the same lease");
        results.check(again.expires_at > first.expires_at, "Repeat read acquire extends the expiry");
        results.check(leases.lease_count() == 1, "No duplicate read lease");
        results.check(leases.get_stats().refreshed == 1, "Refresh is counted");
    }

    phase("Phase 3: Expiry");
    {
        LeaseManager leases(1ms);
        Lease w;
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-a", 1, w) == DsmError::OK,
                      "Short-lived write lease granted");
        std::this_thread::sleep_for(30ms);

        Lease current;
        results.check(leases.validate_lease(w.id, current) == DsmError::EXPIRED, "Lapsed lease validates as EXPIRED");
        results.check(!leases.has_write_lease("arr", 0), "Lapsed writer does not count");

        Lease w2;
        results.check(leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-b", 1, w2) == DsmError::OK,
                      "Expired lease does not block a new writer");
        results.check(leases.validate_lease(w.id, current) == DsmError::NOT_FOUND,
                      "Expired lease is purged by the next acquire");
    }

    phase("Phase 4: Cleanup sweep");
    {
        LeaseManager leases(1ms);
        Lease a, b;
        leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-a", 1, a);
        leases.acquire_lease(ctx, "arr", 1, LeaseType::WRITE, "node-b", 1, b);
        std::this_thread::sleep_for(20ms);
        results.check(leases.cleanup_expired_leases() == 2, "Sweep removes both expired leases");
        results.check(leases.lease_count() == 0, "Table is empty after the sweep");
        results.check(leases.get_stats().expired == 2, "Expiry is counted");

        leases.start_cleanup(10ms);
        results.check(leases.cleanup_running(), "Background sweep started");
        leases.acquire_lease(ctx, "arr", 2, LeaseType::READ, "node-a", 1, a);
        std::this_thread::sleep_for(100ms);
        results.check(leases.lease_count() == 0, "Background sweep removes expired leases");
        leases.stop_cleanup();
        results.check(!leases.cleanup_running(), "Background sweep stopped");
    }

    phase("Phase 5: Release and revoke");
    {
        LeaseManager leases(5000ms);
        Lease a, b, c;
        leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-a", 1, a);
        leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-b", 1, b);
        leases.acquire_lease(ctx, "arr", 1, LeaseType::WRITE, "node-b", 1, c);

        results.check(leases.release_lease("no-such-lease") == DsmError::NOT_FOUND, "Unknown release is NOT_FOUND");
        results.check(leases.revoke_lease("arr", 5) == DsmError::OK, "Revoke of an unleased page is a no-op");
        results.check(leases.revoke_lease("arr", 0) == DsmError::OK, "Revoke page 0");
        results.check(leases.leases_for("arr", 0).empty(), "Page 0 has no leases");

        Lease current;
        results.check(leases.validate_lease(a.id, current) == DsmError::NOT_FOUND, "Revoked lease is gone");
        results.check(leases.validate_lease(c.id, current) == DsmError::OK, "Other page keeps its lease");

        results.check(leases.revoke_leases_held_by("node-b") == 1, "Leases of a departed holder are revoked");
        results.check(leases.lease_count() == 0, "Nothing left");

        leases.acquire_lease(ctx, "arr", 0, LeaseType::READ, "node-a", 1, a);
        leases.acquire_lease(ctx, "arr", 1, LeaseType::WRITE, "node-a", 1, b);
        leases.acquire_lease(ctx, "keep", 0, LeaseType::READ, "node-a", 1, c);
        LeaseType read = LeaseType::READ;
        results.check(leases.release_leases_for("arr", "node-a", &read) == 1, "Typed release drops only reads");
        results.check(leases.revoke_array("arr") == 1, "Array revoke drops the rest of the array");
        results.check(leases.lease_count() == 1, "Other arrays keep their leases");
    }

    phase("Phase 6: Waiting for a conflicting lease");
    {
        LeaseManager leases(5000ms);
        Lease w;
        leases.acquire_lease(ctx, "arr", 0, LeaseType::WRITE, "node-a", 1, w);

        Lease blocked;
        auto start = DsmClock::now();
        DsmError err = leases.acquire_lease(DsmContext::with_timeout(50ms), "arr", 0, LeaseType::WRITE, "node-b", 1,
                                            blocked);
        auto waited = DsmClock::now() - start;
        results.check(err == DsmError::CONFLICT, "Deadline passes while the conflict persists");
        results.check(waited >= 40ms, "Acquirer waited for the deadline");

        std::thread releaser([&]() {
            std::this_thread::sleep_for(30ms);
            leases.release_lease(w.id);
        });
        err = leases.acquire_lease(DsmContext::with_timeout(2000ms), "arr", 0, LeaseType::WRITE, "node-b", 1,
                                   blocked);
        releaser.join();
        results.check(err == DsmError::OK && blocked.owner == "node-b", "Waiter is granted after the release");

        auto flag = std::make_shared<std::atomic<bool>>(false);
        DsmContext cancellable = DsmContext::with_timeout(2000ms);
        cancellable.attach_cancel_flag(flag);
        std::thread canceller([&]() {
            std::this_thread::sleep_for(30ms);
            cancellable.cancel();
        });
        Lease none;
        err = leases.acquire_lease(cancellable, "arr", 0, LeaseType::WRITE, "node-c", 1, none);
        canceller.join();
        results.check(err == DsmError::CANCELLED, "Cancelled waiter returns CANCELLED");
    }

    return results.summary();
}
