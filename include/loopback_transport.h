/*
 * HoloDSM in-process transport
 *
 * Nodes attached to one LoopbackNetwork exchange fully encoded frames with
 * synchronous delivery. Partitions and reply latency can be injected per node.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_LOOPBACK_TRANSPORT_H
#define HOLODSM_LOOPBACK_TRANSPORT_H

#include "dsm_transport.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>

class LoopbackNetwork {
public:
    LoopbackNetwork() = default;
    LoopbackNetwork(const LoopbackNetwork &) = delete;
    LoopbackNetwork &operator=(const LoopbackNetwork &) = delete;

    // An unreachable node neither sends nor receives
    void set_reachable(const NodeID &node, bool reachable);
    // Delay applied before a reply from `node` becomes readable
    void set_latency(const NodeID &node, std::chrono::milliseconds latency);

    bool reachable(const NodeID &node) const;
    std::vector<NodeID> nodes() const;

private:
    friend class LoopbackTransport;
    friend class LoopbackStream;

    struct Endpoint {
        std::shared_ptr<DsmMessageHandler> handler;
        bool reachable = true;
        std::chrono::milliseconds latency{0};
    };

    void attach(const NodeID &node);
    void bind(const NodeID &node, std::shared_ptr<DsmMessageHandler> handler);
    void unbind(const NodeID &node);

    // Delivers one encoded frame to `dst` and returns its encoded reply
    DsmError deliver(const NodeID &src, const NodeID &dst, const std::vector<uint8_t> &frame,
                     std::vector<uint8_t> &reply, std::chrono::milliseconds &latency);

    std::map<NodeID, Endpoint> endpoints_;
    mutable std::mutex mutex_;
};

class LoopbackTransport : public DsmTransport {
public:
    LoopbackTransport(LoopbackNetwork &network, const NodeID &node_id);
    ~LoopbackTransport() override;

    const NodeID &local_node() const override { return node_id_; }
    std::vector<NodeID> peers() const override;
    DsmError open_stream(const DsmContext &ctx, const NodeID &peer, std::unique_ptr<DsmStream> &out) override;
    void set_message_handler(DsmMessageHandler handler) override;
    DsmError start() override;
    void stop() override;

private:
    LoopbackNetwork &network_;
    NodeID node_id_;
    std::shared_ptr<DsmMessageHandler> handler_;
    bool started_ = false;
};

#endif // HOLODSM_LOOPBACK_TRANSPORT_H
