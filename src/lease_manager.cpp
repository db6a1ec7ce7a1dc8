/*
 * HoloDSM lease manager implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "lease_manager.h"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace {
// Upper bound on one wait slice so cancellation is noticed promptly
constexpr auto CONFLICT_WAIT_SLICE = std::chrono::milliseconds(10);
} // namespace

LeaseManager::LeaseManager(std::chrono::milliseconds ttl) : ttl_(ttl) {}

LeaseManager::~LeaseManager() { stop_cleanup(); }

void LeaseManager::purge_expired_locked(const PageKey &key, DsmClock::time_point now) {
    auto it = leases_.find(key);
    if (it == leases_.end()) return;

    auto &list = it->second;
    for (auto lit = list.begin(); lit != list.end();) {
        if (lit->expired(now)) {
            SPDLOG_DEBUG("Lease {} on array {} page {} expired", lit->id, key.array_id, key.page_id);
            index_.erase(lit->id);
            lit = list.erase(lit);
            total_expired_++;
        } else {
            ++lit;
        }
    }
    if (list.empty()) {
        leases_.erase(it);
    }
}

bool LeaseManager::conflicts_locked(const PageKey &key, LeaseType type, DsmClock::time_point now) const {
    auto it = leases_.find(key);
    if (it == leases_.end()) return false;

    for (const auto &lease : it->second) {
        if (lease.expired(now)) continue;
        if (lease.type == LeaseType::WRITE) return true;
        if (type == LeaseType::WRITE) return true;
    }
    return false;
}

void LeaseManager::erase_key_locked(const PageKey &key) {
    auto it = leases_.find(key);
    if (it == leases_.end()) return;
    for (const auto &lease : it->second) {
        index_.erase(lease.id);
    }
    leases_.erase(it);
}

DsmError LeaseManager::acquire_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, LeaseType type,
                                     const std::string &owner, Version version, Lease &out,
                                     const LeaseID &requested_id) {
    PageKey key{array_id, page_id};
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (;;) {
        if (ctx.cancelled()) {
            return DsmError::CANCELLED;
        }

        auto now = DsmClock::now();
        purge_expired_locked(key, now);
        if (!conflicts_locked(key, type, now)) {
            break;
        }

        if (!ctx.has_deadline() || ctx.expired()) {
            total_conflicts_++;
            SPDLOG_DEBUG("{} lease for {} on array {} page {} conflicts with an existing lease",
                         lease_type_string(type), owner, array_id, page_id);
            return DsmError::CONFLICT;
        }
        released_cv_.wait_until(lock, std::min(ctx.deadline(), now + CONFLICT_WAIT_SLICE));
    }

    auto now = DsmClock::now();
    auto &list = leases_[key];

    if (type == LeaseType::READ) {
        for (auto &lease : list) {
            if (lease.type == LeaseType::READ && lease.owner == owner) {
                lease.expires_at = now + ttl_;
                total_refreshed_++;
                out = lease;
                return DsmError::OK;
            }
        }
    }

    Lease lease;
    lease.id = requested_id.empty() || index_.count(requested_id) ? generate_uuid() : requested_id;
    lease.array_id = array_id;
    lease.page_id = page_id;
    lease.type = type;
    lease.owner = owner;
    lease.expires_at = now + ttl_;
    lease.version = version;

    list.push_back(lease);
    index_[lease.id] = key;
    total_granted_++;

    SPDLOG_DEBUG("Granted {} lease {} on array {} page {} to {}", lease_type_string(type), lease.id, array_id,
                 page_id, owner);
    out = std::move(lease);
    return DsmError::OK;
}

DsmError LeaseManager::release_lease(const LeaseID &lease_id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto idx = index_.find(lease_id);
        if (idx == index_.end()) {
            return DsmError::NOT_FOUND;
        }
        PageKey key = idx->second;
        index_.erase(idx);

        auto it = leases_.find(key);
        if (it != leases_.end()) {
            auto &list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [&lease_id](const Lease &l) { return l.id == lease_id; }),
                       list.end());
            if (list.empty()) {
                leases_.erase(it);
            }
        }
        total_released_++;
        SPDLOG_DEBUG("Released lease {} on array {} page {}", lease_id, key.array_id, key.page_id);
    }
    released_cv_.notify_all();
    return DsmError::OK;
}

DsmError LeaseManager::take_lease(const LeaseID &lease_id, Lease &out) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto idx = index_.find(lease_id);
        if (idx == index_.end()) {
            return DsmError::NOT_FOUND;
        }
        auto it = leases_.find(idx->second);
        index_.erase(idx);
        if (it == leases_.end()) {
            return DsmError::NOT_FOUND;
        }
        auto &list = it->second;
        auto lit = std::find_if(list.begin(), list.end(), [&lease_id](const Lease &l) { return l.id == lease_id; });
        if (lit == list.end()) {
            return DsmError::NOT_FOUND;
        }
        out = *lit;
        list.erase(lit);
        if (list.empty()) {
            leases_.erase(it);
        }
        total_released_++;
    }
    released_cv_.notify_all();
    return DsmError::OK;
}

bool LeaseManager::note_page_claim(const LeaseID &lease_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto idx = index_.find(lease_id);
    if (idx == index_.end()) return false;
    auto it = leases_.find(idx->second);
    if (it == leases_.end()) return false;
    for (auto &lease : it->second) {
        if (lease.id == lease_id) {
            lease.claimed_page = true;
            return true;
        }
    }
    return false;
}

DsmError LeaseManager::validate_lease(const LeaseID &lease_id, Lease &out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto idx = index_.find(lease_id);
    if (idx == index_.end()) {
        return DsmError::NOT_FOUND;
    }
    auto it = leases_.find(idx->second);
    if (it == leases_.end()) {
        return DsmError::NOT_FOUND;
    }
    for (const auto &lease : it->second) {
        if (lease.id != lease_id) continue;
        if (lease.expired(DsmClock::now())) {
            return DsmError::EXPIRED;
        }
        out = lease;
        return DsmError::OK;
    }
    return DsmError::NOT_FOUND;
}

bool LeaseManager::has_write_lease(const ArrayID &array_id, PageID page_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = leases_.find(PageKey{array_id, page_id});
    if (it == leases_.end()) return false;

    auto now = DsmClock::now();
    for (const auto &lease : it->second) {
        if (lease.type == LeaseType::WRITE && !lease.expired(now)) {
            return true;
        }
    }
    return false;
}

DsmError LeaseManager::revoke_lease(const ArrayID &array_id, PageID page_id) {
    PageKey key{array_id, page_id};
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = leases_.find(key);
        if (it == leases_.end()) {
            return DsmError::OK;
        }
        total_revoked_ += it->second.size();
        erase_key_locked(key);
        SPDLOG_DEBUG("Revoked leases on array {} page {}", array_id, page_id);
    }
    released_cv_.notify_all();
    return DsmError::OK;
}

size_t LeaseManager::revoke_leases_held_by(const std::string &owner) {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = leases_.begin(); it != leases_.end();) {
            auto &list = it->second;
            for (auto lit = list.begin(); lit != list.end();) {
                if (lit->owner == owner) {
                    index_.erase(lit->id);
                    lit = list.erase(lit);
                    removed++;
                } else {
                    ++lit;
                }
            }
            it = list.empty() ? leases_.erase(it) : std::next(it);
        }
        total_revoked_ += removed;
    }
    if (removed > 0) {
        SPDLOG_INFO("Revoked {} lease(s) held by {}", removed, owner);
        released_cv_.notify_all();
    }
    return removed;
}

size_t LeaseManager::release_leases_for(const ArrayID &array_id, const std::string &owner, const LeaseType *type) {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = leases_.begin(); it != leases_.end();) {
            if (it->first.array_id != array_id) {
                ++it;
                continue;
            }
            auto &list = it->second;
            for (auto lit = list.begin(); lit != list.end();) {
                if (lit->owner == owner && (type == nullptr || lit->type == *type)) {
                    index_.erase(lit->id);
                    lit = list.erase(lit);
                    removed++;
                } else {
                    ++lit;
                }
            }
            it = list.empty() ? leases_.erase(it) : std::next(it);
        }
        total_released_ += removed;
    }
    if (removed > 0) {
        released_cv_.notify_all();
    }
    return removed;
}

size_t LeaseManager::revoke_array(const ArrayID &array_id) {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = leases_.begin(); it != leases_.end();) {
            if (it->first.array_id != array_id) {
                ++it;
                continue;
            }
            for (const auto &lease : it->second) {
                index_.erase(lease.id);
            }
            removed += it->second.size();
            it = leases_.erase(it);
        }
        total_revoked_ += removed;
    }
    if (removed > 0) {
        released_cv_.notify_all();
    }
    return removed;
}

size_t LeaseManager::cleanup_expired_leases() {
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = DsmClock::now();
        for (auto it = leases_.begin(); it != leases_.end();) {
            auto &list = it->second;
            for (auto lit = list.begin(); lit != list.end();) {
                if (lit->expired(now)) {
                    SPDLOG_DEBUG("Cleaned up expired lease {} on array {} page {}", lit->id, it->first.array_id,
                                 it->first.page_id);
                    index_.erase(lit->id);
                    lit = list.erase(lit);
                    removed++;
                } else {
                    ++lit;
                }
            }
            it = list.empty() ? leases_.erase(it) : std::next(it);
        }
        total_expired_ += removed;
    }
    if (removed > 0) {
        released_cv_.notify_all();
    }
    return removed;
}

void LeaseManager::start_cleanup(std::chrono::milliseconds interval) {
    if (cleanup_running_.exchange(true)) {
        return;
    }
    cleanup_thread_ = std::thread(&LeaseManager::cleanup_loop, this, interval);
    SPDLOG_DEBUG("Lease cleanup running every {} ms", interval.count());
}

void LeaseManager::stop_cleanup() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        if (!cleanup_running_.exchange(false)) {
            return;
        }
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

void LeaseManager::cleanup_loop(std::chrono::milliseconds interval) {
    while (cleanup_running_) {
        {
            std::unique_lock<std::mutex> lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock, interval, [this]() { return !cleanup_running_.load(); });
        }
        if (!cleanup_running_) break;

        size_t removed = cleanup_expired_leases();
        if (removed > 0) {
            SPDLOG_DEBUG("Periodic sweep removed {} expired lease(s)", removed);
        }
    }
}

size_t LeaseManager::lease_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.size();
}

std::vector<Lease> LeaseManager::leases_for(const ArrayID &array_id, PageID page_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = leases_.find(PageKey{array_id, page_id});
    if (it == leases_.end()) return {};
    return it->second;
}

LeaseManager::Stats LeaseManager::get_stats() const {
    Stats stats;
    stats.granted = total_granted_.load();
    stats.refreshed = total_refreshed_.load();
    stats.conflicts = total_conflicts_.load();
    stats.released = total_released_.load();
    stats.revoked = total_revoked_.load();
    stats.expired = total_expired_.load();
    return stats;
}
