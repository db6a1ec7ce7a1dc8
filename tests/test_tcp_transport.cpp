/*
 * Test: TCP transport on localhost
 *
 * Starts listeners on ephemeral ports, exchanges frames through the
 * request/response path, checks the error mapping for unknown and closed
 * peers, and runs a Set/Sync/Get cycle between two engines over TCP.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "memory_manager.h"
#include "shared_array.h"
#include "tcp_transport.h"
#include "test_common.h"
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== HoloDSM TCP Transport Test ===" << std::endl;
    TestResult results;
    const DsmContext ctx = DsmContext::background();

    phase("Phase 1: Raw request/response");
    {
        TcpTransport server("server", "127.0.0.1", 0);
        server.set_message_handler([](const DsmMessage &req, DsmMessage &resp) {
            resp = make_reply(req, DSM_MSG_PAGE_RESPONSE, "server");
            resp.version = req.version + 1;
            resp.page_data.assign(DSM_PAGE_SIZE, 0x5A);
        });
        results.check(server.start() == DsmError::OK && server.running(), "Server listening");
        results.check(server.port() != 0, "Ephemeral port resolved");

        TcpTransport client("client", "127.0.0.1", 0);
        client.set_message_handler([](const DsmMessage &req, DsmMessage &resp) {
            resp = make_reply(req, DSM_MSG_NONE, "client");
        });
        results.check(client.start() == DsmError::OK, "Client listening");
        client.add_peer("server", "127.0.0.1", server.port());
        results.check(client.peers().size() == 1, "Client knows one peer");

        DsmMessage req;
        req.type = DSM_MSG_PAGE_REQUEST;
        req.array_id = "arr";
        req.page_id = 4;
        req.version = 6;
        DsmMessage resp;
        DsmError err = client.request(DsmContext::with_timeout(2000ms), "server", req, resp);
        results.check(err == DsmError::OK, "Request answered");
        results.check(req.src_node == "client" && req.msg_id != 0, "Request stamped with sender and id");
        results.check(resp.msg_id == req.msg_id && resp.src_node == "server", "Reply matches the request");
        results.check(resp.page_id == 4 && resp.version == 7, "Reply fields survive the wire");
        results.check(resp.page_data.size() == DSM_PAGE_SIZE && resp.page_data[100] == 0x5A,
                      "Full page crosses the wire");

        for (int i = 0; i < 5; i++) {
            DsmMessage again;
            err = client.request(DsmContext::with_timeout(2000ms), "server", req, again);
            if (err != DsmError::OK || again.msg_id != req.msg_id) {
                break;
            }
        }
        results.check(err == DsmError::OK, "Repeated requests on fresh connections");

        results.check(client.request(ctx, "nobody", req, resp) == DsmError::NOT_FOUND, "Unknown peer is NOT_FOUND");

        uint16_t closed_port = server.port();
        server.stop();
        results.check(!server.running(), "Server stopped");
        client.add_peer("gone", "127.0.0.1", closed_port);
        err = client.request(DsmContext::with_timeout(1000ms), "gone", req, resp);
        results.check(err == DsmError::UNREACHABLE, "Closed port is UNREACHABLE");
        client.stop();
    }

    phase("Phase 2: Engines over TCP");
    {
        DsmConfig config_a;
        config_a.node_id = "tcp-a";
        config_a.bind_addr = "127.0.0.1";
        config_a.port = 0;
        DsmConfig config_b = config_a;
        config_b.node_id = "tcp-b";

        TcpTransport ta(config_a.node_id, config_a.bind_addr, config_a.port);
        TcpTransport tb(config_b.node_id, config_b.bind_addr, config_b.port);
        MemoryManager a(config_a, &ta);
        MemoryManager b(config_b, &tb);
        results.check(a.start() == DsmError::OK && b.start() == DsmError::OK, "Both engines started");
        ta.add_peer("tcp-b", "127.0.0.1", tb.port());
        tb.add_peer("tcp-a", "127.0.0.1", ta.port());

        std::unique_ptr<SharedArray> on_a, on_b;
        results.check(SharedArray::create(a, ctx, 1000, ElementType::INT64, ArrayPolicy(), on_a).ok(),
                      "Array created on tcp-a");
        results.check(SharedArray::open(b, ctx, on_a->id(), "tcp-a", ArrayPolicy(), on_b).ok(),
                      "tcp-b opened it over TCP");

        SyncReport report;
        results.check(on_a->set_int64(ctx, 10, 1234).ok(), "tcp-a writes");
        results.check(on_a->sync(ctx, &report).ok() && report.peers_notified == 1, "tcp-a Sync notified tcp-b");

        int64_t value = -1;
        results.check(on_b->get_int64(ctx, 10, value).ok() && value == 1234, "tcp-b reads 1234");

        results.check(on_b->set_int64(ctx, 11, -5).ok(), "tcp-b writes through a remote lease");
        results.check(on_b->sync(ctx).ok(), "tcp-b Sync pushes to tcp-a");
        results.check(on_a->get_int64(ctx, 11, value).ok() && value == -5, "tcp-a reads -5");

        b.stop();
        a.stop();
        results.check(!ta.running() && !tb.running(), "Transports stopped with their engines");
    }

    return results.summary();
}
