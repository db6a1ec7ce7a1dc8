/*
 * Test: failure handling
 *
 * Verifies membership reactions (lease revocation and page unmapping when
 * a node fails), partitions during Sync, request deadlines under network
 * latency, cancellation, lease expiry before a flush and reclaiming a page
 * whose owner left.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "loopback_transport.h"
#include "memory_manager.h"
#include "shared_array.h"
#include "test_common.h"
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <thread>

using namespace std::chrono_literals;

namespace {
DsmConfig node_config(const NodeID &id, std::chrono::milliseconds lease_ttl = 5000ms) {
    DsmConfig config;
    config.node_id = id;
    config.cache_capacity_pages = 64;
    config.lease_ttl = lease_ttl;
    config.cleanup_interval = 20ms;
    config.request_timeout = 2000ms;
    return config;
}

template <typename Pred> bool wait_for(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = DsmClock::now() + timeout;
    while (DsmClock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}
} // namespace

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== HoloDSM Failure Handling Test ===" << std::endl;
    TestResult results;
    const DsmContext ctx = DsmContext::background();

    LoopbackNetwork network;
    LoopbackTransport ta(network, "node-a");
    LoopbackTransport tb(network, "node-b");
    LoopbackTransport tc(network, "node-c");
    MemoryManager a(node_config("node-a"), &ta);
    MemoryManager b(node_config("node-b"), &tb);
    MemoryManager c(node_config("node-c"), &tc);
    results.check(a.start() == DsmError::OK && b.start() == DsmError::OK && c.start() == DsmError::OK,
                  "Three nodes started");

    std::unique_ptr<SharedArray> on_a, on_b, on_c;
    SharedArray::create(a, ctx, 30000, ElementType::INT64, ArrayPolicy(), on_a);
    const ArrayID id = on_a->id();
    results.check(SharedArray::open(b, ctx, id, "node-a", ArrayPolicy(), on_b).ok() &&
                      SharedArray::open(c, ctx, id, "node-a", ArrayPolicy(), on_c).ok(),
                  "Array open on every node");

    phase("Phase 1: Unreachable peer during Sync");
    {
        network.set_reachable("node-c", false);
        results.check(!network.reachable("node-c"), "node-c partitioned");
        on_a->set_int64(ctx, 0, 11);
        SyncReport report;
        results.check(on_a->sync(ctx, &report).ok(), "Sync completes despite the partition");
        results.check(report.peers_notified == 1 && report.peers_unreachable == 1, "Partitioned peer counted");

        int64_t value = -1;
        results.check(on_b->get_int64(ctx, 0, value).ok() && value == 11, "Reachable peer sees the write");
        results.check(on_c->get_int64(ctx, 0, value).ok() && value == 0,
                      "Partitioned peer never learned the owner");

        results.check(on_c->set_int64(ctx, 1, 1).code == DsmError::UNREACHABLE,
                      "Partitioned node cannot reach the lease authority");
        results.check(!c.has_pending_writes(id), "Failed write left nothing pending");
        network.set_reachable("node-c", true);

        std::shared_ptr<DsmArray> ghost;
        results.check(b.open_array(ctx, "no-such-array", "node-z", ghost).code == DsmError::NOT_FOUND,
                      "Unknown home node is NOT_FOUND");
    }

    phase("Phase 2: Deadlines under latency");
    {
        network.set_latency("node-a", 300ms);
        int64_t value = -1;
        b.cache().remove(id, 0);
        DsmStatus status = on_b->get_int64(DsmContext::with_timeout(50ms), 0, value);
        results.check(status.code == DsmError::TIMEOUT, "Slow owner times the read out");
        results.check(!b.cache().contains(id, 0), "Timed-out fetch left the cache untouched");
        results.check(b.get_stats().remote_fetch_failures >= 1, "Failed fetch counted");

        // The home grants before the slow reply misses the deadline
        status = on_b->set_int64(DsmContext::with_timeout(50ms), 3, 7);
        results.check(status.code == DsmError::TIMEOUT, "Slow home times the write lease out");
        results.check(!a.leases().has_write_lease(id, 0) && a.leases().leases_for(id, 0).empty(),
                      "Timed-out grant withdrawn on the home");
        results.check(!b.has_pending_writes(id), "Timed-out write left nothing pending");

        status = on_b->set_int64(DsmContext::with_timeout(50ms), 9000, 7);
        results.check(status.code == DsmError::TIMEOUT, "Timed-out write on an unmapped page");
        NodeID owner;
        results.check(!a.leases().has_write_lease(id, 1), "No write lease left on the unmapped page");
        results.check(!a.get_array(id)->page_owner(1, owner), "Withdrawn grant gave up its claim");

        network.set_latency("node-a", 0ms);
        results.check(on_b->get_int64(DsmContext::with_timeout(1000ms), 0, value).ok() && value == 11,
                      "Read succeeds once latency clears");
        results.check(on_a->set_int64(ctx, 3, 9).ok(), "Home writes the page without waiting for a TTL");
        results.check(on_a->sync(ctx).ok(), "node-a Sync");
        results.check(!a.get_array(id)->page_owner(1, owner), "Page 1 still unmapped");
    }

    phase("Phase 3: Cancellation");
    {
        results.check(on_b->set_int64(ctx, 2, 22).ok(), "node-b writes");
        auto flag = std::make_shared<std::atomic<bool>>(false);
        DsmContext cancellable;
        cancellable.attach_cancel_flag(flag);
        cancellable.cancel();
        DsmStatus status = on_b->sync(cancellable);
        results.check(status.code == DsmError::CANCELLED, "Cancelled Sync returns CANCELLED");
        results.check(b.has_pending_writes(id), "Working pages survive a cancelled Sync");
        results.check(b.get_array(id)->sync_state() == SyncState::ACTIVE, "Array stays ACTIVE");
        results.check(on_b->sync(ctx).ok(), "Retry with a live context succeeds");

        int64_t value = -1;
        results.check(on_a->get_int64(ctx, 2, value).ok() && value == 22, "Retried Sync delivered the write");
    }

    phase("Phase 4: Node failure revokes leases and unmaps pages");
    {
        int64_t value = -1;
        results.check(on_b->set_int64(ctx, 9000, 5).ok(), "node-b claims page 1");
        results.check(on_b->sync(ctx).ok(), "node-b Sync");
        results.check(on_b->set_int64(ctx, 17000, 6).ok(), "node-b holds a write lease on page 2");
        results.check(a.leases().leases_for(id, 2).size() == 1, "Home tracks node-b's lease");

        results.check(a.member_events().publish(MemberEventType::FAILED, "node-b"), "Failure published");
        results.check(wait_for([&]() { return a.leases().leases_for(id, 2).empty(); }),
                      "node-b's leases revoked on the home");
        NodeID owner;
        results.check(wait_for([&]() { return !a.get_array(id)->page_owner(1, owner); }),
                      "node-b's pages unmapped on the home");
        results.check(on_a->get_int64(ctx, 9000, value).ok() && value == 0, "Unmapped page reads as zero");
        results.check(on_a->set_int64(ctx, 17000, 8).ok(), "Page 2 is writable again");
        results.check(on_a->sync(ctx).ok(), "node-a Sync");

        a.handle_member_event(MemberEvent{MemberEventType::FAILED, "node-a"});
        results.check(a.get_array(id)->page_owner(0, owner) && owner == "node-a",
                      "A node ignores reports of its own failure");
        a.handle_member_event(MemberEvent{MemberEventType::JOINED, "node-d"});
        a.handle_member_event(MemberEvent{MemberEventType::SUSPECT, "node-c"});
        results.check(a.get_array(id)->mapped_pages() == 2, "JOINED and SUSPECT change nothing");

        // node-b's own view is stale; drop its array state before reuse
        results.check(b.delete_array(ctx, id).ok(), "node-b forgets the array");
        results.check(b.get_array(id) == nullptr, "Array gone on node-b");
    }

    phase("Phase 5: Writer reclaims a page whose owner left");
    {
        std::unique_ptr<SharedArray> rejoined;
        results.check(SharedArray::open(b, ctx, id, "node-a", ArrayPolicy(), rejoined).ok(), "node-b reopens");
        results.check(rejoined->set_int64(ctx, 25000, 4).ok() && rejoined->sync(ctx).ok(), "node-b claims page 3");

        NodeID owner;
        results.check(c.get_array(id)->page_owner(3, owner) && owner == "node-b", "node-c learned the owner");
        results.check(on_c->set_int64(ctx, 25001, 3).ok(), "node-c writes into node-b's page");

        // Owner departs while node-c holds its working copy
        a.handle_member_event(MemberEvent{MemberEventType::LEFT, "node-b"});
        c.handle_member_event(MemberEvent{MemberEventType::LEFT, "node-b"});
        results.check(!c.get_array(id)->page_owner(3, owner), "node-c unmapped node-b's pages");
        results.check(!a.get_array(id)->page_owner(3, owner), "Home unmapped node-b's pages");

        SyncReport report;
        results.check(on_c->sync(ctx, &report).ok() && report.pages_flushed == 1, "node-c Sync re-claims the page");
        results.check(c.get_array(id)->page_owner(3, owner) && owner == "node-c", "node-c owns page 3");
        results.check(a.get_array(id)->page_owner(3, owner) && owner == "node-c", "Home agrees");

        int64_t value = -1;
        results.check(on_c->get_int64(ctx, 25001, value).ok() && value == 3, "Reclaimed page holds the write");
        results.check(on_a->get_int64(ctx, 25000, value).ok() && value == 4, "Earlier contents carried over");
    }

    phase("Phase 6: Expired write lease is renewed without losing other writes");
    {
        LoopbackNetwork net2;
        LoopbackTransport t1(net2, "home");
        LoopbackTransport t2(net2, "writer");
        LoopbackTransport t3(net2, "other");
        MemoryManager home(node_config("home", 100ms), &t1);
        MemoryManager writer(node_config("writer"), &t2);
        MemoryManager other(node_config("other"), &t3);
        results.check(home.start() == DsmError::OK && writer.start() == DsmError::OK &&
                          other.start() == DsmError::OK,
                      "Short-TTL cluster started");

        std::unique_ptr<SharedArray> h, w, o;
        SharedArray::create(home, ctx, 100, ElementType::INT64, ArrayPolicy(), h);
        h->set_int64(ctx, 0, 1);
        h->sync(ctx);
        SharedArray::open(writer, ctx, h->id(), "home", ArrayPolicy(), w);
        SharedArray::open(other, ctx, h->id(), "home", ArrayPolicy(), o);

        results.check(w->set_int64(ctx, 5, 55).ok(), "Writer takes a 100 ms lease");
        std::this_thread::sleep_for(300ms);
        results.check(home.leases().lease_count() == 0, "Home swept the expired lease");

        results.check(o->set_int64(ctx, 6, 66).ok(), "Other node writes the same page meanwhile");
        results.check(o->sync(ctx).ok(), "Other node syncs first");

        SyncReport report;
        results.check(w->sync(ctx, &report).ok() && report.pages_flushed == 1,
                      "Sync renews the lapsed lease and pushes");
        int64_t value = -1;
        results.check(h->get_int64(ctx, 5, value).ok() && value == 55, "Home sees the renewed write");
        results.check(h->get_int64(ctx, 6, value).ok() && value == 66, "Write synced meanwhile survives");
        results.check(h->get_int64(ctx, 0, value).ok() && value == 1, "Home kept its earlier value");

        // Same race with the renewal taken by the next write instead of the flush
        results.check(w->set_int64(ctx, 7, 77).ok(), "Writer opens a new working copy");
        std::this_thread::sleep_for(300ms);
        results.check(o->set_int64(ctx, 8, 88).ok() && o->sync(ctx).ok(), "Other node writes and syncs again");
        results.check(w->set_int64(ctx, 9, 99).ok(), "Next write renews the lapsed lease");
        results.check(w->sync(ctx).ok(), "Writer syncs");
        results.check(h->get_int64(ctx, 7, value).ok() && value == 77, "Write before the lapse kept");
        results.check(h->get_int64(ctx, 8, value).ok() && value == 88, "Other node's write kept");
        results.check(h->get_int64(ctx, 9, value).ok() && value == 99, "Write after the renewal kept");
        results.check(h->get_int64(ctx, 6, value).ok() && value == 66, "Earlier writes untouched");

        other.stop();
        writer.stop();
        home.stop();
    }

    c.stop();
    b.stop();
    a.stop();
    return results.summary();
}
