/*
 * HoloDSM TCP transport
 *
 * Thread-per-connection server plus on-demand client streams. Each stream is
 * one TCP connection carrying length-delimited DsmMessage frames; connect and
 * read honour the caller's deadline.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_TCP_TRANSPORT_H
#define HOLODSM_TCP_TRANSPORT_H

#include "dsm_transport.h"
#include <atomic>
#include <chrono>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#define TCP_LISTEN_BACKLOG 64
#define TCP_DEFAULT_CONNECT_TIMEOUT_MS 2000

class TcpStream : public DsmStream {
public:
    explicit TcpStream(int fd);
    ~TcpStream() override;

    TcpStream(const TcpStream &) = delete;
    TcpStream &operator=(const TcpStream &) = delete;

    DsmError write_message(const DsmContext &ctx, const DsmMessage &msg) override;
    DsmError read_message(const DsmContext &ctx, DsmMessage &msg) override;
    void close() override;

    // Reliable send/recv helpers; recv waits no later than the deadline
    static DsmError send_all(int fd, const void *buf, size_t len);
    static DsmError recv_all(int fd, void *buf, size_t len, const DsmContext &ctx);

private:
    int fd_;
};

class TcpTransport : public DsmTransport {
public:
    TcpTransport(const NodeID &node_id, const std::string &bind_addr, uint16_t port);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport &) = delete;
    TcpTransport &operator=(const TcpTransport &) = delete;

    void add_peer(const NodeID &id, const std::string &host, uint16_t port);
    // Applied when the caller's context carries no deadline
    void set_connect_timeout(std::chrono::milliseconds timeout) { connect_timeout_ = timeout; }

    const NodeID &local_node() const override { return node_id_; }
    std::vector<NodeID> peers() const override;
    DsmError open_stream(const DsmContext &ctx, const NodeID &peer, std::unique_ptr<DsmStream> &out) override;
    void set_message_handler(DsmMessageHandler handler) override;
    DsmError start() override;
    void stop() override;

    // Actual listening port, resolved after start() when bound to port 0
    uint16_t port() const { return port_; }
    bool running() const { return running_.load(); }

private:
    struct PeerAddress {
        std::string host;
        uint16_t port;
    };

    struct Connection {
        int fd;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int fd, std::shared_ptr<std::atomic<bool>> done);
    // Joins and closes connections whose peer hung up; caller holds connections_mutex_
    void reap_connections_locked();
    int connect_to(const PeerAddress &addr, const DsmContext &ctx, DsmError &err);

    NodeID node_id_;
    std::string bind_addr_;
    uint16_t port_;
    int listen_fd_ = -1;
    std::chrono::milliseconds connect_timeout_{TCP_DEFAULT_CONNECT_TIMEOUT_MS};

    std::map<NodeID, PeerAddress> peers_;
    mutable std::mutex peers_mutex_;

    DsmMessageHandler handler_;
    std::mutex handler_mutex_;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::list<Connection> connections_;
    std::mutex connections_mutex_;
};

#endif // HOLODSM_TCP_TRANSPORT_H
