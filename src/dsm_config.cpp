/*
 * HoloDSM configuration implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_config.h"
#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

bool env_u64(const char *name, uint64_t &out) {
    const char *value = getenv(name);
    if (!value || !*value) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    unsigned long long parsed = strtoull(value, &end, 0);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-') {
        SPDLOG_WARN("Ignoring {}={}: not an unsigned integer", name, value);
        return false;
    }
    out = parsed;
    return true;
}

bool env_ms(const char *name, std::chrono::milliseconds &out) {
    uint64_t ms;
    if (!env_u64(name, ms)) {
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

} // namespace

DsmError parse_peer(const std::string &entry, PeerConfig &out) {
    auto eq = entry.find('=');
    auto colon = entry.rfind(':');
    if (eq == std::string::npos || eq == 0 || colon == std::string::npos || colon < eq + 2 ||
        colon + 1 >= entry.size()) {
        SPDLOG_ERROR("Peer '{}' is not of the form id=host:port", entry);
        return DsmError::INVALID_ARGUMENT;
    }

    std::string port_str = entry.substr(colon + 1);
    char *end = nullptr;
    errno = 0;
    unsigned long port = strtoul(port_str.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || port == 0 || port > 65535) {
        SPDLOG_ERROR("Peer '{}' has an invalid port", entry);
        return DsmError::INVALID_ARGUMENT;
    }

    out.id = entry.substr(0, eq);
    out.host = entry.substr(eq + 1, colon - eq - 1);
    out.port = static_cast<uint16_t>(port);
    return DsmError::OK;
}

void DsmConfig::apply_env() {
    const char *node = getenv("HOLODSM_NODE_ID");
    if (node && *node) {
        node_id = node;
    }

    uint64_t value;
    if (env_u64("HOLODSM_CACHE_MB", value)) {
        cache_capacity_pages = static_cast<size_t>(value * 1024 * 1024 / DSM_PAGE_SIZE);
    }
    // An explicit page count wins over the byte budget
    if (env_u64("HOLODSM_CACHE_PAGES", value)) {
        cache_capacity_pages = static_cast<size_t>(value);
    }

    env_ms("HOLODSM_LEASE_TTL_MS", lease_ttl);
    env_ms("HOLODSM_CLEANUP_INTERVAL_MS", cleanup_interval);
    env_ms("HOLODSM_REQUEST_TIMEOUT_MS", request_timeout);

    const char *bind = getenv("HOLODSM_BIND_ADDR");
    if (bind && *bind) {
        bind_addr = bind;
    }
    if (env_u64("HOLODSM_PORT", value)) {
        if (value > 65535) {
            SPDLOG_WARN("Ignoring HOLODSM_PORT={}: out of range", value);
        } else {
            port = static_cast<uint16_t>(value);
        }
    }
}

DsmError DsmConfig::validate() const {
    if (node_id.empty()) {
        SPDLOG_ERROR("Configuration: node id must not be empty");
        return DsmError::INVALID_ARGUMENT;
    }
    if (lease_ttl.count() <= 0) {
        SPDLOG_ERROR("Configuration: lease TTL must be positive");
        return DsmError::INVALID_ARGUMENT;
    }
    if (cleanup_interval.count() <= 0) {
        SPDLOG_ERROR("Configuration: cleanup interval must be positive");
        return DsmError::INVALID_ARGUMENT;
    }
    if (request_timeout.count() <= 0) {
        SPDLOG_ERROR("Configuration: request timeout must be positive");
        return DsmError::INVALID_ARGUMENT;
    }
    for (const auto &peer : peers) {
        if (peer.id == node_id) {
            SPDLOG_ERROR("Configuration: peer list contains this node ({})", node_id);
            return DsmError::INVALID_ARGUMENT;
        }
    }
    return DsmError::OK;
}

std::string DsmConfig::describe() const {
    return fmt::format("node={} cache={} pages lease_ttl={}ms cleanup={}ms timeout={}ms listen={}:{} peers={}",
                       node_id, cache_capacity_pages, lease_ttl.count(), cleanup_interval.count(),
                       request_timeout.count(), bind_addr, port, peers.size());
}
