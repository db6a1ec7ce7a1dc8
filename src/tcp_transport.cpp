/*
 * HoloDSM TCP transport implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "tcp_transport.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
// Longest single poll() so cancellation and shutdown are noticed
constexpr int POLL_SLICE_MS = 100;

int poll_timeout(const DsmContext &ctx) {
    if (!ctx.has_deadline()) {
        return POLL_SLICE_MS;
    }
    auto remaining = ctx.remaining().count();
    return static_cast<int>(std::min<int64_t>(remaining, POLL_SLICE_MS));
}

void set_nodelay(int fd) {
    int opt = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        SPDLOG_WARN("Failed to set TCP_NODELAY on fd {}: {}", fd, strerror(errno));
    }
}
} // namespace

// ---- TcpStream ----

TcpStream::TcpStream(int fd) : fd_(fd) {}

TcpStream::~TcpStream() { close(); }

DsmError TcpStream::send_all(int fd, const void *buf, size_t len) {
    const uint8_t *ptr = static_cast<const uint8_t *>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(10));
                continue;
            }
            return DsmError::UNREACHABLE;
        }
        if (sent == 0) return DsmError::UNREACHABLE;
        ptr += sent;
        remaining -= sent;
    }
    return DsmError::OK;
}

DsmError TcpStream::recv_all(int fd, void *buf, size_t len, const DsmContext &ctx) {
    uint8_t *ptr = static_cast<uint8_t *>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        DsmError err = ctx.check();
        if (err != DsmError::OK) {
            return err;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, poll_timeout(ctx));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return DsmError::UNREACHABLE;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t received = ::recv(fd, ptr, remaining, 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return DsmError::UNREACHABLE;
        }
        if (received == 0) return DsmError::UNREACHABLE; // Connection closed
        ptr += received;
        remaining -= received;
    }
    return DsmError::OK;
}

DsmError TcpStream::write_message(const DsmContext &ctx, const DsmMessage &msg) {
    if (fd_ < 0) {
        return DsmError::UNREACHABLE;
    }
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return err;
    }
    std::vector<uint8_t> frame = encode_message(msg);
    if (frame.size() - DSM_MSG_HEADER_SIZE > DSM_MAX_PAYLOAD) {
        SPDLOG_ERROR("Refusing to send {} with {} byte payload", dsm_msg_type_string(msg.type),
                     frame.size() - DSM_MSG_HEADER_SIZE);
        return DsmError::PROTOCOL;
    }
    return send_all(fd_, frame.data(), frame.size());
}

DsmError TcpStream::read_message(const DsmContext &ctx, DsmMessage &msg) {
    if (fd_ < 0) {
        return DsmError::UNREACHABLE;
    }
    uint8_t raw[DSM_MSG_HEADER_SIZE];
    DsmError err = recv_all(fd_, raw, sizeof(raw), ctx);
    if (err != DsmError::OK) {
        return err;
    }

    dsm_msg_header_t header;
    err = decode_header(raw, sizeof(raw), header);
    if (err != DsmError::OK) {
        return err;
    }

    std::vector<uint8_t> payload(header.payload_size);
    if (!payload.empty()) {
        err = recv_all(fd_, payload.data(), payload.size(), ctx);
        if (err != DsmError::OK) {
            return err;
        }
    }
    return decode_payload(header, payload.data(), payload.size(), msg);
}

void TcpStream::close() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

// ---- TcpTransport ----

TcpTransport::TcpTransport(const NodeID &node_id, const std::string &bind_addr, uint16_t port)
    : node_id_(node_id), bind_addr_(bind_addr), port_(port) {}

TcpTransport::~TcpTransport() { stop(); }

void TcpTransport::add_peer(const NodeID &id, const std::string &host, uint16_t port) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_[id] = PeerAddress{host, port};
    SPDLOG_DEBUG("Peer {} at {}:{}", id, host, port);
}

std::vector<NodeID> TcpTransport::peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<NodeID> out;
    for (const auto &entry : peers_) {
        if (entry.first != node_id_) {
            out.push_back(entry.first);
        }
    }
    return out;
}

void TcpTransport::set_message_handler(DsmMessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

DsmError TcpTransport::start() {
    if (running_) {
        return DsmError::OK;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        SPDLOG_ERROR("Failed to create TCP server socket: {}", strerror(errno));
        return DsmError::UNREACHABLE;
    }

    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        SPDLOG_WARN("Failed to set SO_REUSEADDR: {}", strerror(errno));
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);

    if (bind_addr_ == "0.0.0.0" || bind_addr_.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
        SPDLOG_ERROR("Invalid bind address {}", bind_addr_);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return DsmError::INVALID_ARGUMENT;
    }

    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
        SPDLOG_ERROR("Failed to bind TCP address {}:{}: {}", bind_addr_, port_, strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return DsmError::UNREACHABLE;
    }

    if (::listen(listen_fd_, TCP_LISTEN_BACKLOG) < 0) {
        SPDLOG_ERROR("Failed to listen on TCP socket: {}", strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return DsmError::UNREACHABLE;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    accept_thread_ = std::thread(&TcpTransport::accept_loop, this);
    SPDLOG_INFO("Node {} listening on {}:{}", node_id_, bind_addr_, port_);
    return DsmError::OK;
}

void TcpTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::list<Connection> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto &conn : connections) {
        ::shutdown(conn.fd, SHUT_RDWR);
    }
    for (auto &conn : connections) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
        ::close(conn.fd);
    }
    SPDLOG_INFO("Node {} stopped listening", node_id_);
}

void TcpTransport::reap_connections_locked() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            ::close(it->fd);
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void TcpTransport::accept_loop() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (ret <= 0) {
            continue;
        }

        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int fd = ::accept(listen_fd_, reinterpret_cast<struct sockaddr *>(&client_addr), &addr_len);
        if (fd < 0) {
            if (running_ && errno != EINTR && errno != EAGAIN) {
                SPDLOG_WARN("Failed to accept connection: {}", strerror(errno));
            }
            continue;
        }
        set_nodelay(fd);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        reap_connections_locked();
        if (!running_) {
            ::close(fd);
            break;
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        connections_.push_back(Connection{fd, std::thread(&TcpTransport::handle_connection, this, fd, done), done});
    }
}

void TcpTransport::handle_connection(int fd, std::shared_ptr<std::atomic<bool>> done) {
    DsmContext ctx;

    while (running_) {
        uint8_t raw[DSM_MSG_HEADER_SIZE];
        if (TcpStream::recv_all(fd, raw, sizeof(raw), ctx) != DsmError::OK) {
            break;
        }

        dsm_msg_header_t header;
        if (decode_header(raw, sizeof(raw), header) != DsmError::OK) {
            SPDLOG_WARN("Dropping connection after malformed frame header");
            break;
        }
        std::vector<uint8_t> payload(header.payload_size);
        if (!payload.empty() && TcpStream::recv_all(fd, payload.data(), payload.size(), ctx) != DsmError::OK) {
            break;
        }

        DsmMessage req;
        if (decode_payload(header, payload.data(), payload.size(), req) != DsmError::OK) {
            SPDLOG_WARN("Dropping connection after malformed {} payload", dsm_msg_type_string(header.msg_type));
            break;
        }

        DsmMessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = handler_;
        }
        if (!handler) {
            SPDLOG_ERROR("Node {} has no message handler for {}", node_id_, dsm_msg_type_string(req.type));
            break;
        }

        DsmMessage resp = make_reply(req, DSM_MSG_NONE, node_id_);
        handler(req, resp);

        std::vector<uint8_t> frame = encode_message(resp);
        if (TcpStream::send_all(fd, frame.data(), frame.size()) != DsmError::OK) {
            break;
        }
    }

    done->store(true);
}

int TcpTransport::connect_to(const PeerAddress &peer, const DsmContext &ctx, DsmError &err) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *res = nullptr;
    std::string port = std::to_string(peer.port);
    int rc = ::getaddrinfo(peer.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        SPDLOG_WARN("Cannot resolve {}: {}", peer.host, gai_strerror(rc));
        err = DsmError::UNREACHABLE;
        return -1;
    }

    int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        SPDLOG_ERROR("Failed to create TCP client socket: {}", strerror(errno));
        ::freeaddrinfo(res);
        err = DsmError::UNREACHABLE;
        return -1;
    }
    set_nodelay(fd);

    // Connect with timeout using non-blocking + poll
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int ret = ::connect(fd, res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);
    if (ret < 0 && errno != EINPROGRESS) {
        SPDLOG_DEBUG("Failed to connect to {}:{}: {}", peer.host, peer.port, strerror(errno));
        ::close(fd);
        err = DsmError::UNREACHABLE;
        return -1;
    }

    if (ret < 0) {
        DsmContext connect_ctx = ctx.has_deadline() ? ctx : ctx.child(connect_timeout_);
        for (;;) {
            err = connect_ctx.check();
            if (err != DsmError::OK) {
                SPDLOG_DEBUG("Connection to {}:{} gave up: {}", peer.host, peer.port, dsm_error_string(err));
                ::close(fd);
                return -1;
            }
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            ret = ::poll(&pfd, 1, poll_timeout(connect_ctx));
            if (ret > 0) break;
            if (ret < 0 && errno != EINTR) {
                ::close(fd);
                err = DsmError::UNREACHABLE;
                return -1;
            }
        }

        int so_error = 0;
        socklen_t errlen = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &errlen) < 0 || so_error != 0) {
            SPDLOG_DEBUG("Connection to {}:{} failed: {}", peer.host, peer.port, strerror(so_error));
            ::close(fd);
            err = DsmError::UNREACHABLE;
            return -1;
        }
    }

    // Set back to blocking
    fcntl(fd, F_SETFL, flags);
    err = DsmError::OK;
    return fd;
}

DsmError TcpTransport::open_stream(const DsmContext &ctx, const NodeID &peer, std::unique_ptr<DsmStream> &out) {
    PeerAddress addr;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            return DsmError::NOT_FOUND;
        }
        addr = it->second;
    }

    DsmError err = DsmError::OK;
    int fd = connect_to(addr, ctx, err);
    if (fd < 0) {
        return err;
    }
    out = std::make_unique<TcpStream>(fd);
    return DsmError::OK;
}
