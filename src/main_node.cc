/*
 * HoloDSM node daemon
 * Runs one TCP-backed coherence engine until SIGINT/SIGTERM, logging engine
 * statistics periodically.
 *
 *  SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 *  Copyright 2025 Regents of the University of California
 *  UC Santa Cruz Sluglab.
 */

#include "dsm_config.h"
#include "memory_manager.h"
#include "tcp_transport.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {
constexpr auto STATS_INTERVAL = std::chrono::seconds(30);

std::atomic<bool> g_running{true};

void signal_handler(int) { g_running = false; }
} // namespace

int main(int argc, char *argv[]) {
    spdlog::cfg::load_env_levels();
    cxxopts::Options options("holodsm_node", "HoloDSM distributed shared memory node");

    DsmConfig config;
    config.apply_env();

    options.add_options()
        ("h,help", "Print usage")
        ("v,verbose", "Log level: 0=error 1=warn 2=info 3=debug 4=trace", cxxopts::value<int>()->default_value("2"))
        ("node-id", "Identity of this node", cxxopts::value<std::string>()->default_value(config.node_id))
        ("bind", "Listen address", cxxopts::value<std::string>()->default_value(config.bind_addr))
        ("p,port", "Listen port", cxxopts::value<int>()->default_value(std::to_string(config.port)))
        ("peer", "Peer as id=host:port (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("cache-pages", "Page cache capacity in pages",
         cxxopts::value<size_t>()->default_value(std::to_string(config.cache_capacity_pages)))
        ("lease-ttl-ms", "Lease time-to-live",
         cxxopts::value<int64_t>()->default_value(std::to_string(config.lease_ttl.count())))
        ("cleanup-interval-ms", "Expired lease sweep interval",
         cxxopts::value<int64_t>()->default_value(std::to_string(config.cleanup_interval.count())))
        ("request-timeout-ms", "Deadline for remote requests without one",
         cxxopts::value<int64_t>()->default_value(std::to_string(config.request_timeout.count())));

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception &e) {
        SPDLOG_ERROR("{}", e.what());
        fmt::print("{}\n", options.help());
        return 1;
    }

    if (result.count("help")) {
        fmt::print("{}\n", options.help());
        return 0;
    }

    if (result.count("verbose")) {
        static const spdlog::level::level_enum levels[] = {spdlog::level::err, spdlog::level::warn,
                                                           spdlog::level::info, spdlog::level::debug,
                                                           spdlog::level::trace};
        int verbose = std::clamp(result["verbose"].as<int>(), 0, 4);
        spdlog::set_level(levels[verbose]);
    }

    config.node_id = result["node-id"].as<std::string>();
    config.bind_addr = result["bind"].as<std::string>();
    int port = result["port"].as<int>();
    if (port < 0 || port > 65535) {
        SPDLOG_ERROR("Invalid port {}", port);
        return 1;
    }
    config.port = static_cast<uint16_t>(port);
    config.cache_capacity_pages = result["cache-pages"].as<size_t>();
    config.lease_ttl = std::chrono::milliseconds(result["lease-ttl-ms"].as<int64_t>());
    config.cleanup_interval = std::chrono::milliseconds(result["cleanup-interval-ms"].as<int64_t>());
    config.request_timeout = std::chrono::milliseconds(result["request-timeout-ms"].as<int64_t>());

    if (result.count("peer")) {
        for (const auto &entry : result["peer"].as<std::vector<std::string>>()) {
            PeerConfig peer;
            if (parse_peer(entry, peer) != DsmError::OK) {
                return 1;
            }
            config.peers.push_back(peer);
        }
    }

    if (config.validate() != DsmError::OK) {
        return 1;
    }

    SPDLOG_INFO("========================================");
    SPDLOG_INFO("HoloDSM node");
    SPDLOG_INFO("========================================");
    SPDLOG_INFO("  Node:            {}", config.node_id);
    SPDLOG_INFO("  Listen:          {}:{}", config.bind_addr, config.port);
    SPDLOG_INFO("  Cache:           {} pages of {} bytes", config.cache_capacity_pages, DSM_PAGE_SIZE);
    SPDLOG_INFO("  Lease TTL:       {} ms", config.lease_ttl.count());
    SPDLOG_INFO("  Cleanup:         every {} ms", config.cleanup_interval.count());
    SPDLOG_INFO("  Request timeout: {} ms", config.request_timeout.count());
    for (const auto &peer : config.peers) {
        SPDLOG_INFO("  Peer:            {} at {}:{}", peer.id, peer.host, peer.port);
    }
    SPDLOG_INFO("========================================");

    TcpTransport transport(config.node_id, config.bind_addr, config.port);
    transport.set_connect_timeout(config.request_timeout);
    for (const auto &peer : config.peers) {
        transport.add_peer(peer.id, peer.host, peer.port);
    }

    MemoryManager manager(config, &transport);
    DsmError err = manager.start();
    if (err != DsmError::OK) {
        SPDLOG_ERROR("Failed to start node {}: {}", config.node_id, dsm_error_string(err));
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto next_report = std::chrono::steady_clock::now() + STATS_INTERVAL;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() < next_report) {
            continue;
        }
        next_report += STATS_INTERVAL;

        auto cache = manager.cache().get_stats();
        auto leases = manager.leases().get_stats();
        auto stats = manager.get_stats();
        SPDLOG_INFO("Arrays: {}  cache: {}/{} pages, {} hits, {} misses, {} evictions", manager.array_count(),
                    manager.cache().size(), manager.cache().capacity(), cache.hits, cache.misses, cache.evictions);
        SPDLOG_INFO("Leases: {} active, {} granted, {} conflicts, {} expired, {} revoked",
                    manager.leases().lease_count(), leases.granted, leases.conflicts, leases.expired,
                    leases.revoked);
        SPDLOG_INFO("Pages: {} local reads, {} remote fetches ({} failed), {} pushed, {} syncs",
                    stats.local_reads, stats.remote_fetches, stats.remote_fetch_failures, stats.pages_pushed,
                    stats.syncs_completed);
    }

    SPDLOG_INFO("Shutting down node {}...", config.node_id);
    manager.stop();
    return 0;
}
