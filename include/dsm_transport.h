/*
 * HoloDSM transport capability
 *
 * The coherence engine talks to peers only through these two interfaces.
 * A stream carries framed DsmMessages to one peer; the transport opens
 * streams and dispatches inbound requests to a single handler.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_DSM_TRANSPORT_H
#define HOLODSM_DSM_TRANSPORT_H

#include "dsm_protocol.h"
#include "dsm_types.h"
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

// Fills the reply for an inbound request
using DsmMessageHandler = std::function<void(const DsmMessage &, DsmMessage &)>;

class DsmStream {
public:
    virtual ~DsmStream() = default;

    virtual DsmError write_message(const DsmContext &ctx, const DsmMessage &msg) = 0;
    virtual DsmError read_message(const DsmContext &ctx, DsmMessage &msg) = 0;
    virtual void close() = 0;
};

class DsmTransport {
public:
    virtual ~DsmTransport() = default;

    virtual const NodeID &local_node() const = 0;
    virtual std::vector<NodeID> peers() const = 0;

    // NOT_FOUND for an unknown peer, UNREACHABLE when it cannot be contacted
    virtual DsmError open_stream(const DsmContext &ctx, const NodeID &peer, std::unique_ptr<DsmStream> &out) = 0;
    virtual void set_message_handler(DsmMessageHandler handler) = 0;
    virtual DsmError start() = 0;
    virtual void stop() = 0;

    /*
     * One request/response exchange on a fresh stream. Stamps the sender and
     * a message id on `req`. Only transport failures are returned here; the
     * peer's verdict travels in resp.status.
     */
    DsmError request(const DsmContext &ctx, const NodeID &peer, DsmMessage &req, DsmMessage &resp);

private:
    std::atomic<uint32_t> next_msg_id_{1};
};

#endif // HOLODSM_DSM_TRANSPORT_H
