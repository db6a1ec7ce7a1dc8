/*
 * HoloDSM in-process transport implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "loopback_transport.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace {
constexpr auto LATENCY_POLL_SLICE = std::chrono::milliseconds(2);
} // namespace

void LoopbackNetwork::set_reachable(const NodeID &node, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[node].reachable = reachable;
    SPDLOG_DEBUG("Loopback: {} is now {}", node, reachable ? "reachable" : "partitioned");
}

void LoopbackNetwork::set_latency(const NodeID &node, std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[node].latency = latency;
}

bool LoopbackNetwork::reachable(const NodeID &node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(node);
    return it != endpoints_.end() && it->second.reachable && it->second.handler;
}

std::vector<NodeID> LoopbackNetwork::nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeID> out;
    for (const auto &entry : endpoints_) {
        out.push_back(entry.first);
    }
    return out;
}

void LoopbackNetwork::attach(const NodeID &node) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.emplace(node, Endpoint());
}

void LoopbackNetwork::bind(const NodeID &node, std::shared_ptr<DsmMessageHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[node].handler = std::move(handler);
}

void LoopbackNetwork::unbind(const NodeID &node) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(node);
    if (it != endpoints_.end()) {
        it->second.handler.reset();
    }
}

DsmError LoopbackNetwork::deliver(const NodeID &src, const NodeID &dst, const std::vector<uint8_t> &frame,
                                  std::vector<uint8_t> &reply, std::chrono::milliseconds &latency) {
    std::shared_ptr<DsmMessageHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dit = endpoints_.find(dst);
        if (dit == endpoints_.end()) {
            return DsmError::NOT_FOUND;
        }
        auto sit = endpoints_.find(src);
        bool src_up = sit == endpoints_.end() || sit->second.reachable;
        if (!src_up || !dit->second.reachable || !dit->second.handler) {
            return DsmError::UNREACHABLE;
        }
        handler = dit->second.handler;
        latency = dit->second.latency;
    }

    DsmMessage req;
    DsmError err = decode_message(frame, req);
    if (err != DsmError::OK) {
        return err;
    }

    DsmMessage resp = make_reply(req, DSM_MSG_NONE, dst);
    (*handler)(req, resp);
    reply = encode_message(resp);
    return DsmError::OK;
}

class LoopbackStream : public DsmStream {
public:
    LoopbackStream(LoopbackNetwork &network, const NodeID &src, const NodeID &dst)
        : network_(network), src_(src), dst_(dst) {}

    DsmError write_message(const DsmContext &ctx, const DsmMessage &msg) override {
        if (closed_) {
            return DsmError::UNREACHABLE;
        }
        DsmError err = ctx.check();
        if (err != DsmError::OK) {
            return err;
        }
        std::vector<uint8_t> reply;
        std::chrono::milliseconds latency{0};
        err = network_.deliver(src_, dst_, encode_message(msg), reply, latency);
        if (err != DsmError::OK) {
            return err;
        }
        pending_.push_back(Pending{std::move(reply), DsmClock::now() + latency});
        return DsmError::OK;
    }

    DsmError read_message(const DsmContext &ctx, DsmMessage &msg) override {
        if (closed_ || pending_.empty()) {
            return DsmError::UNREACHABLE;
        }
        const auto ready_at = pending_.front().ready_at;
        for (;;) {
            if (ctx.cancelled()) {
                return DsmError::CANCELLED;
            }
            auto now = DsmClock::now();
            if (now >= ready_at) {
                break;
            }
            if (ctx.has_deadline() && now >= ctx.deadline()) {
                return DsmError::TIMEOUT;
            }
            auto wake = std::min(ready_at, now + LATENCY_POLL_SLICE);
            if (ctx.has_deadline()) {
                wake = std::min(wake, ctx.deadline());
            }
            std::this_thread::sleep_until(wake);
        }

        std::vector<uint8_t> frame = std::move(pending_.front().frame);
        pending_.erase(pending_.begin());
        return decode_message(frame, msg);
    }

    void close() override {
        closed_ = true;
        pending_.clear();
    }

private:
    struct Pending {
        std::vector<uint8_t> frame;
        DsmClock::time_point ready_at;
    };

    LoopbackNetwork &network_;
    NodeID src_;
    NodeID dst_;
    std::vector<Pending> pending_;
    bool closed_ = false;
};

LoopbackTransport::LoopbackTransport(LoopbackNetwork &network, const NodeID &node_id)
    : network_(network), node_id_(node_id) {
    network_.attach(node_id_);
}

LoopbackTransport::~LoopbackTransport() { stop(); }

std::vector<NodeID> LoopbackTransport::peers() const {
    std::vector<NodeID> out = network_.nodes();
    out.erase(std::remove(out.begin(), out.end(), node_id_), out.end());
    return out;
}

DsmError LoopbackTransport::open_stream(const DsmContext &ctx, const NodeID &peer, std::unique_ptr<DsmStream> &out) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return err;
    }
    auto known = network_.nodes();
    if (std::find(known.begin(), known.end(), peer) == known.end()) {
        return DsmError::NOT_FOUND;
    }
    if (!network_.reachable(peer)) {
        return DsmError::UNREACHABLE;
    }
    out = std::make_unique<LoopbackStream>(network_, node_id_, peer);
    return DsmError::OK;
}

void LoopbackTransport::set_message_handler(DsmMessageHandler handler) {
    handler_ = std::make_shared<DsmMessageHandler>(std::move(handler));
    if (started_) {
        network_.bind(node_id_, handler_);
    }
}

DsmError LoopbackTransport::start() {
    if (!handler_) {
        SPDLOG_ERROR("Loopback transport {} started without a message handler", node_id_);
        return DsmError::INVALID_ARGUMENT;
    }
    network_.bind(node_id_, handler_);
    started_ = true;
    SPDLOG_DEBUG("Loopback transport {} attached", node_id_);
    return DsmError::OK;
}

void LoopbackTransport::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    network_.unbind(node_id_);
    SPDLOG_DEBUG("Loopback transport {} detached", node_id_);
}
