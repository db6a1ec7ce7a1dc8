/*
 * HoloDSM configuration
 *
 * Plain settings injected into a MemoryManager at construction. Environment
 * variables (HOLODSM_*) may overlay the defaults; the node daemon overlays
 * its command line on top of that.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_DSM_CONFIG_H
#define HOLODSM_DSM_CONFIG_H

#include "dsm_types.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#define DSM_DEFAULT_PORT 9900

struct PeerConfig {
    NodeID id;
    std::string host;
    uint16_t port = DSM_DEFAULT_PORT;
};

// "id=host:port"
DsmError parse_peer(const std::string &entry, PeerConfig &out);

struct DsmConfig {
    NodeID node_id = "node-0";
    size_t cache_capacity_pages = 1024;
    std::chrono::milliseconds lease_ttl{5000};
    std::chrono::milliseconds cleanup_interval{1000};
    std::chrono::milliseconds request_timeout{5000};

    std::string bind_addr = "0.0.0.0";
    uint16_t port = DSM_DEFAULT_PORT;
    std::vector<PeerConfig> peers;

    // Malformed values are logged and ignored
    void apply_env();
    DsmError validate() const;
    std::string describe() const;
};

#endif // HOLODSM_DSM_CONFIG_H
