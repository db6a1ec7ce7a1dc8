/*
 * HoloDSM memory manager implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "memory_manager.h"
#include "sync_protocol.h"
#include <cstring>
#include <fmt/format.h>
#include <iterator>
#include <spdlog/spdlog.h>

namespace {

DsmStatus fail(DsmError code, const ArrayID &array_id, PageID page_id, std::string message,
               const LeaseID &lease_id = "") {
    return report_failure(DsmStatus::failure(code, array_id, page_id, std::move(message), lease_id));
}

uint32_t remaining_ms(const Lease &lease) {
    auto now = DsmClock::now();
    if (lease.expires_at <= now) {
        return 0;
    }
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(lease.expires_at - now).count());
}

// Releases that find the lease already gone are not failures
bool benign_release_error(DsmError err) { return err == DsmError::NOT_FOUND || err == DsmError::EXPIRED; }

} // namespace

DsmStatus report_failure(DsmStatus status) {
    switch (status.code) {
    case DsmError::OK:
        break;
    case DsmError::OUT_OF_BOUNDS:
    case DsmError::PROTOCOL:
    case DsmError::INVALID_ARGUMENT:
        SPDLOG_ERROR("{}", status.describe());
        break;
    default:
        SPDLOG_WARN("{}", status.describe());
        break;
    }
    return status;
}

MemoryManager::MemoryManager(const DsmConfig &config, DsmTransport *transport)
    : config_(config), transport_(transport), leases_(config.lease_ttl), cache_(config.cache_capacity_pages) {
    SPDLOG_DEBUG("MemoryManager {}: {}", config_.node_id, config_.describe());
}

MemoryManager::~MemoryManager() { stop(); }

DsmError MemoryManager::start() {
    if (running_) {
        return DsmError::OK;
    }
    DsmError err = config_.validate();
    if (err != DsmError::OK) {
        return err;
    }

    if (transport_) {
        transport_->set_message_handler([this](const DsmMessage &req, DsmMessage &resp) { handle_message(req, resp); });
        err = transport_->start();
        if (err != DsmError::OK) {
            SPDLOG_ERROR("Node {} failed to start its transport: {}", local_node(), dsm_error_string(err));
            return err;
        }
    }

    leases_.start_cleanup(config_.cleanup_interval);
    running_ = true;
    member_thread_ = std::thread(&MemoryManager::member_event_loop, this);
    SPDLOG_INFO("Node {} started ({} peer(s))", local_node(), transport_ ? transport_->peers().size() : 0);
    return DsmError::OK;
}

void MemoryManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (member_thread_.joinable()) {
        member_thread_.join();
    }
    leases_.stop_cleanup();
    if (transport_) {
        transport_->stop();
    }
    SPDLOG_INFO("Node {} stopped", local_node());
}

// ---- Arrays ----

DsmStatus MemoryManager::create_array(const DsmContext &ctx, uint64_t length, ElementType type,
                                      std::shared_ptr<DsmArray> &out) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return fail(err, "", -1, "create_array interrupted");
    }
    if (length > DsmArray::max_length(element_size(type))) {
        return fail(DsmError::INVALID_ARGUMENT, "", -1,
                    fmt::format("{} {} elements need more pages than a page id can address", length,
                                element_type_string(type)));
    }

    auto array = std::make_shared<DsmArray>(generate_uuid(), length, type, local_node());
    {
        std::unique_lock<std::shared_mutex> lock(arrays_mutex_);
        arrays_[array->id()] = array;
    }
    SPDLOG_INFO("Created array {} ({} {} elements, {} pages)", array->id(), length, element_type_string(type),
                array->num_pages());
    out = std::move(array);
    return DsmStatus::success();
}

std::shared_ptr<DsmArray> MemoryManager::get_array(const ArrayID &array_id) const {
    std::shared_lock<std::shared_mutex> lock(arrays_mutex_);
    auto it = arrays_.find(array_id);
    return it == arrays_.end() ? nullptr : it->second;
}

size_t MemoryManager::array_count() const {
    std::shared_lock<std::shared_mutex> lock(arrays_mutex_);
    return arrays_.size();
}

std::vector<Lease> MemoryManager::forget_array_state(const ArrayID &array_id) {
    std::vector<Lease> held;
    {
        std::lock_guard<std::mutex> lock(working_mutex_);
        for (auto it = working_set_.begin(); it != working_set_.end();) {
            if (it->first.array_id == array_id) {
                held.push_back(it->second.lease);
                it = working_set_.erase(it);
            } else {
                ++it;
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(pins_mutex_);
        for (auto it = read_pins_.begin(); it != read_pins_.end();) {
            if (it->first.array_id == array_id) {
                held.push_back(it->second);
                it = read_pins_.erase(it);
            } else {
                ++it;
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(local_pages_mutex_);
        for (auto it = local_pages_.begin(); it != local_pages_.end();) {
            it = it->first.array_id == array_id ? local_pages_.erase(it) : std::next(it);
        }
    }
    return held;
}

DsmStatus MemoryManager::delete_array(const DsmContext &ctx, const ArrayID &array_id) {
    std::shared_ptr<DsmArray> array;
    {
        std::unique_lock<std::shared_mutex> lock(arrays_mutex_);
        auto it = arrays_.find(array_id);
        if (it == arrays_.end()) {
            return fail(DsmError::NOT_FOUND, array_id, -1, "delete of unknown array");
        }
        array = it->second;
        arrays_.erase(it);
    }

    // Wait for in-flight element access and barriers to drain
    std::unique_lock<std::shared_mutex> phase(array->phase_mutex());

    std::vector<Lease> held = forget_array_state(array_id);
    if (array->home_node() != local_node()) {
        DsmContext release_ctx = bounded(ctx);
        for (const auto &lease : held) {
            DsmError err = release_at_home(release_ctx, *array, lease.id);
            if (err != DsmError::OK && !benign_release_error(err)) {
                SPDLOG_WARN("Lease {} on deleted array {} left to expire: {}", lease.id, array_id,
                            dsm_error_string(err));
            }
        }
    }
    size_t revoked = leases_.revoke_array(array_id);
    size_t dropped = cache_.remove_array(array_id);
    SPDLOG_INFO("Deleted array {} ({} lease(s) revoked, {} cached page(s) dropped)", array_id, revoked, dropped);
    return DsmStatus::success();
}

DsmStatus MemoryManager::open_array(const DsmContext &ctx, const ArrayID &array_id, const NodeID &home_node,
                                    std::shared_ptr<DsmArray> &out) {
    out = get_array(array_id);
    if (out) {
        return DsmStatus::success();
    }
    if (home_node == local_node()) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "array is not known on its home node");
    }

    DsmMessage req;
    req.type = DSM_MSG_ARRAY_INFO_REQUEST;
    req.array_id = array_id;
    DsmMessage resp;
    DsmError err = call(ctx, home_node, req, resp);
    if (err != DsmError::OK) {
        return fail(err, array_id, -1, fmt::format("array info from {} failed", home_node));
    }

    if (resp.length > DsmArray::max_length(element_size(resp.element_type))) {
        return fail(DsmError::PROTOCOL, array_id, -1,
                    fmt::format("{} reported {} elements, more than a page id can address", home_node, resp.length));
    }

    NodeID home = resp.home_node.empty() ? home_node : resp.home_node;
    auto array = std::make_shared<DsmArray>(array_id, resp.length, resp.element_type, home);
    array->adopt_version(resp.version);
    array->merge_owners(resp.owners);
    {
        std::unique_lock<std::shared_mutex> lock(arrays_mutex_);
        out = arrays_.emplace(array_id, array).first->second;
    }
    SPDLOG_INFO("Opened array {} from {} ({} elements, version {}, {} mapped page(s))", array_id, home,
                out->length(), out->version(), out->mapped_pages());
    return DsmStatus::success();
}

// ---- Pages ----

DsmContext MemoryManager::bounded(const DsmContext &ctx) const {
    return ctx.has_deadline() ? ctx : ctx.child(config_.request_timeout);
}

DsmError MemoryManager::call(const DsmContext &ctx, const NodeID &peer, DsmMessage &req, DsmMessage &resp) {
    if (peer == local_node()) {
        req.src_node = local_node();
        resp = make_reply(req, DSM_MSG_NONE, local_node());
        handle_message(req, resp);
        return resp.status;
    }
    if (!transport_) {
        return DsmError::UNREACHABLE;
    }
    DsmError err = transport_->request(bounded(ctx), peer, req, resp);
    if (err != DsmError::OK) {
        return err;
    }
    return resp.status;
}

std::shared_ptr<Page> MemoryManager::local_page(const DsmArray &array, PageID page_id) {
    PageKey key{array.id(), page_id};
    std::lock_guard<std::mutex> lock(local_pages_mutex_);
    auto it = local_pages_.find(key);
    if (it != local_pages_.end()) {
        return it->second;
    }
    auto page = std::make_shared<Page>(array.id(), page_id, array.version(), array.page_size());
    local_pages_.emplace(std::move(key), page);
    SPDLOG_DEBUG("Materialized array {} page {} on {}", array.id(), page_id, local_node());
    return page;
}

DsmError MemoryManager::fetch_remote_page(const DsmContext &ctx, const NodeID &owner, const DsmArray &array,
                                          PageID page_id, Version version, std::shared_ptr<Page> &out) {
    DsmMessage req;
    req.type = DSM_MSG_PAGE_REQUEST;
    req.array_id = array.id();
    req.page_id = page_id;
    req.version = version;

    DsmMessage resp;
    DsmError err = call(ctx, owner, req, resp);
    if (err != DsmError::OK) {
        total_remote_fetch_failures_++;
        return err;
    }

    auto page = std::make_shared<Page>(array.id(), page_id, resp.version, array.page_size());
    err = page->load(resp.page_data.data(), resp.page_data.size());
    if (err != DsmError::OK) {
        total_remote_fetch_failures_++;
        return err;
    }
    total_remote_fetches_++;
    out = std::move(page);
    return DsmError::OK;
}

DsmError MemoryManager::resolve_page(const DsmContext &ctx, const DsmArray &array, PageID page_id, Version version,
                                     std::shared_ptr<Page> &out) {
    NodeID owner;
    if (!array.page_owner(page_id, owner)) {
        return DsmError::NOT_FOUND;
    }
    if (owner == local_node()) {
        out = local_page(array, page_id);
        total_local_reads_++;
        return DsmError::OK;
    }

    auto cached = cache_.get(array.id(), page_id);
    if (cached && cached->version() >= version) {
        out = std::move(cached);
        return DsmError::OK;
    }

    const uint64_t epoch = array.fill_epoch();
    std::shared_ptr<Page> fetched;
    DsmError err = fetch_remote_page(ctx, owner, array, page_id, version, fetched);
    if (err != DsmError::OK) {
        return err;
    }
    {
        std::lock_guard<std::mutex> lock(fill_mutex_);
        if (array.fill_epoch() == epoch) {
            cache_.put(array.id(), page_id, fetched);
        } else {
            SPDLOG_DEBUG("Array {} page {} was invalidated during its fetch; not caching it", array.id(), page_id);
        }
    }
    out = std::move(fetched);
    return DsmError::OK;
}

void MemoryManager::drop_cached_pages(DsmArray &array, const std::vector<PageID> &pages) {
    std::lock_guard<std::mutex> lock(fill_mutex_);
    array.bump_fill_epoch();
    for (PageID page_id : pages) {
        cache_.remove(array.id(), page_id);
    }
}

DsmStatus MemoryManager::request_page(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, Version version,
                                      std::shared_ptr<Page> &out) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, "request_page interrupted");
    }
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, page_id, "unknown array");
    }
    if (!array->valid_page(page_id)) {
        return fail(DsmError::OUT_OF_BOUNDS, array_id, page_id,
                    fmt::format("array has {} page(s)", array->num_pages()));
    }

    err = resolve_page(ctx, *array, page_id, version, out);
    if (err == DsmError::NOT_FOUND) {
        return fail(err, array_id, page_id, "page has no owner or the owner does not hold it");
    }
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, "page fetch failed");
    }
    return DsmStatus::success();
}

// ---- Leases ----

DsmError MemoryManager::grant_lease(const DsmContext &ctx, DsmArray &array, PageID page_id, LeaseType type,
                                    const NodeID &requester, Version version, Lease &out, NodeID &page_owner,
                                    const LeaseID &requested_id) {
    if (!array.valid_page(page_id)) {
        return DsmError::OUT_OF_BOUNDS;
    }
    DsmError err = leases_.acquire_lease(ctx, array.id(), page_id, type, requester, version, out, requested_id);
    if (err != DsmError::OK) {
        return err;
    }
    if (type == LeaseType::WRITE) {
        // The first writer of an unmapped page becomes its owner
        std::lock_guard<std::mutex> lock(claim_mutex_);
        NodeID prior;
        bool mapped = array.page_owner(page_id, prior);
        page_owner = array.claim_page_owner(page_id, requester);
        if (!mapped && page_owner == requester && !leases_.note_page_claim(out.id)) {
            // Abandoned between the grant and the claim
            array.release_page_claim(page_id, requester);
            return DsmError::CANCELLED;
        }
    } else if (!array.page_owner(page_id, page_owner)) {
        page_owner.clear();
    }
    return DsmError::OK;
}

DsmError MemoryManager::acquire_at_home(const DsmContext &ctx, DsmArray &array, PageID page_id, LeaseType type,
                                        Lease &out, NodeID &page_owner) {
    if (array.home_node() == local_node()) {
        return grant_lease(ctx, array, page_id, type, local_node(), array.version(), out, page_owner);
    }

    DsmMessage req;
    req.type = DSM_MSG_LEASE_ACQUIRE;
    req.array_id = array.id();
    req.page_id = page_id;
    req.lease_type = type;
    req.owner = local_node();
    req.version = array.version();
    // Names the lease so it can be withdrawn if the grant never arrives
    req.lease_id = generate_uuid();

    DsmMessage resp;
    DsmError err = call(ctx, array.home_node(), req, resp);
    // A reply, even a refusal, means nothing is left to withdraw
    if ((err == DsmError::TIMEOUT || err == DsmError::CANCELLED) && resp.type != DSM_MSG_LEASE_GRANT) {
        abandon_at_home(array, page_id, req.lease_id);
    }
    if (err != DsmError::OK) {
        return err;
    }

    out.id = resp.lease_id;
    out.array_id = array.id();
    out.page_id = page_id;
    out.type = resp.lease_type;
    out.owner = resp.owner;
    out.version = resp.version;
    out.expires_at = DsmClock::now() + std::chrono::milliseconds(resp.ttl_ms);
    page_owner = resp.page_owner;
    if (!page_owner.empty()) {
        err = array.set_page_owner(page_id, page_owner);
        if (err != DsmError::OK) {
            return err;
        }
    }
    return DsmError::OK;
}

DsmError MemoryManager::release_at_home(const DsmContext &ctx, const DsmArray &array, const LeaseID &lease_id) {
    if (array.home_node() == local_node()) {
        return leases_.release_lease(lease_id);
    }
    DsmMessage req;
    req.type = DSM_MSG_LEASE_RELEASE;
    req.array_id = array.id();
    req.lease_id = lease_id;
    DsmMessage resp;
    return call(ctx, array.home_node(), req, resp);
}

void MemoryManager::abandon_at_home(const DsmArray &array, PageID page_id, const LeaseID &token) {
    DsmMessage req;
    req.type = DSM_MSG_LEASE_ABANDON;
    req.array_id = array.id();
    req.page_id = page_id;
    req.lease_id = token;
    DsmMessage resp;
    DsmError err = call(DsmContext::with_timeout(config_.request_timeout), array.home_node(), req, resp);
    if (err != DsmError::OK) {
        SPDLOG_WARN("Could not withdraw lease request {} on array {} page {}; it will expire: {}", token, array.id(),
                    page_id, dsm_error_string(err));
        return;
    }
    SPDLOG_DEBUG("Withdrew lease request {} on array {} page {}", token, array.id(), page_id);
}

DsmError MemoryManager::validate_at_home(const DsmContext &ctx, const DsmArray &array, const LeaseID &lease_id,
                                         Lease &out) {
    if (array.home_node() == local_node()) {
        return leases_.validate_lease(lease_id, out);
    }
    DsmMessage req;
    req.type = DSM_MSG_LEASE_VALIDATE;
    req.array_id = array.id();
    req.lease_id = lease_id;
    DsmMessage resp;
    DsmError err = call(ctx, array.home_node(), req, resp);
    if (err != DsmError::OK) {
        return err;
    }
    out.id = lease_id;
    out.array_id = array.id();
    out.page_id = resp.page_id;
    out.expires_at = DsmClock::now() + std::chrono::milliseconds(resp.ttl_ms);
    return DsmError::OK;
}

DsmStatus MemoryManager::acquire_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id, LeaseType type,
                                       Lease &out) {
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, page_id, "unknown array");
    }
    NodeID page_owner;
    DsmError err = acquire_at_home(ctx, *array, page_id, type, out, page_owner);
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, fmt::format("{} lease not granted", lease_type_string(type)));
    }
    return DsmStatus::success();
}

DsmStatus MemoryManager::release_lease(const DsmContext &ctx, const ArrayID &array_id, const LeaseID &lease_id) {
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "unknown array", lease_id);
    }
    DsmError err = release_at_home(ctx, *array, lease_id);
    if (err != DsmError::OK) {
        return fail(err, array_id, -1, "lease release failed", lease_id);
    }
    return DsmStatus::success();
}

DsmStatus MemoryManager::validate_lease(const DsmContext &ctx, const ArrayID &array_id, const LeaseID &lease_id,
                                        Lease &out) {
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "unknown array", lease_id);
    }
    DsmError err = validate_at_home(ctx, *array, lease_id, out);
    if (err != DsmError::OK) {
        return fail(err, array_id, -1, "lease is not valid", lease_id);
    }
    return DsmStatus::success();
}

DsmStatus MemoryManager::revoke_lease(const DsmContext &ctx, const ArrayID &array_id, PageID page_id) {
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, page_id, "unknown array");
    }
    DsmError err;
    if (array->home_node() == local_node()) {
        err = leases_.revoke_lease(array_id, page_id);
    } else {
        DsmMessage req;
        req.type = DSM_MSG_LEASE_REVOKE;
        req.array_id = array_id;
        req.page_id = page_id;
        DsmMessage resp;
        err = call(ctx, array->home_node(), req, resp);
    }
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, "lease revoke failed");
    }
    return DsmStatus::success();
}

std::mutex &MemoryManager::acquire_stripe(const PageKey &key) {
    return acquire_stripes_[PageKeyHash{}(key) % ACQUIRE_STRIPES];
}

DsmError MemoryManager::open_working_page(const DsmContext &ctx, DsmArray &array, PageID page_id, WorkingPage &out) {
    PageKey key{array.id(), page_id};

    // Our own read pin would conflict with the write lease
    Lease pin;
    bool pinned = false;
    {
        std::lock_guard<std::mutex> lock(pins_mutex_);
        auto it = read_pins_.find(key);
        if (it != read_pins_.end()) {
            pin = it->second;
            pinned = true;
            read_pins_.erase(it);
        }
    }
    if (pinned) {
        DsmError err = release_at_home(ctx, array, pin.id);
        if (err != DsmError::OK && !benign_release_error(err)) {
            SPDLOG_WARN("Could not release read pin {} on array {} page {}: {}", pin.id, array.id(), page_id,
                        dsm_error_string(err));
        }
    }

    Lease lease;
    NodeID owner;
    DsmError err = acquire_at_home(ctx, array, page_id, LeaseType::WRITE, lease, owner);
    if (err != DsmError::OK) {
        return err;
    }

    std::shared_ptr<Page> page;
    if (owner == local_node()) {
        page = local_page(array, page_id);
    } else if (owner.empty()) {
        SPDLOG_ERROR("Write grant for array {} page {} carried no owner", array.id(), page_id);
        err = DsmError::PROTOCOL;
    } else {
        // Private copy of the owner's bytes, which stay put while we hold the lease
        err = fetch_remote_page(ctx, owner, array, page_id, array.version(), page);
        if (err == DsmError::OK) {
            out.twin = page->snapshot();
        }
    }

    if (err != DsmError::OK) {
        // Leave nothing behind for a write that never started
        DsmError rel = release_at_home(DsmContext::with_timeout(config_.request_timeout), array, lease.id);
        if (rel != DsmError::OK && !benign_release_error(rel)) {
            SPDLOG_WARN("Write lease {} on array {} page {} left to expire: {}", lease.id, array.id(), page_id,
                        dsm_error_string(rel));
        }
        return err;
    }

    out.page = std::move(page);
    out.lease = std::move(lease);
    return DsmError::OK;
}

DsmError MemoryManager::renew_write_lease(const DsmContext &ctx, DsmArray &array, PageID page_id, WorkingPage &wp) {
    DsmError err = release_at_home(ctx, array, wp.lease.id);
    if (err != DsmError::OK && !benign_release_error(err)) {
        return err;
    }

    Lease lease;
    NodeID owner;
    err = acquire_at_home(ctx, array, page_id, LeaseType::WRITE, lease, owner);
    if (err != DsmError::OK) {
        return err;
    }

    PageKey key{array.id(), page_id};
    if (owner != local_node()) {
        if (wp.twin.empty()) {
            // Written in place while owned here, and another node owns it now
            SPDLOG_ERROR("Array {} page {} moved to {} while written in place; dropping the local writes",
                         array.id(), page_id, owner);
            err = DsmError::CONFLICT;
        }

        std::shared_ptr<Page> current;
        if (err == DsmError::OK) {
            err = fetch_remote_page(ctx, owner, array, page_id, array.version(), current);
        }
        std::shared_ptr<Page> rebased;
        size_t carried = 0;
        if (err == DsmError::OK) {
            // Carry over only the elements changed since the copy was taken
            std::vector<uint8_t> base = current->snapshot();
            std::vector<uint8_t> mine = wp.page->snapshot();
            const size_t elem = array.elem_size();
            for (size_t off = 0; off + elem <= mine.size() && off + elem <= wp.twin.size(); off += elem) {
                if (memcmp(&mine[off], &wp.twin[off], elem) != 0) {
                    memcpy(&base[off], &mine[off], elem);
                    carried++;
                }
            }
            rebased = std::make_shared<Page>(array.id(), page_id, current->version(), array.page_size());
            err = rebased->load(base.data(), base.size());
        }
        if (err != DsmError::OK) {
            DsmError rel = release_at_home(DsmContext::with_timeout(config_.request_timeout), array, lease.id);
            if (rel != DsmError::OK && !benign_release_error(rel)) {
                SPDLOG_WARN("Write lease {} on array {} page {} left to expire: {}", lease.id, array.id(), page_id,
                            dsm_error_string(rel));
            }
            if (err == DsmError::CONFLICT) {
                std::lock_guard<std::mutex> lock(working_mutex_);
                working_set_.erase(key);
            }
            return err;
        }

        rebased->mark_dirty();
        wp.twin = current->snapshot();
        wp.page = std::move(rebased);
        SPDLOG_DEBUG("Rebased array {} page {} onto {}'s version {} ({} element(s) carried)", array.id(), page_id,
                     owner, current->version(), carried);
    }
    SPDLOG_DEBUG("Renewed write lease on array {} page {}: {} -> {}", array.id(), page_id, wp.lease.id, lease.id);
    wp.lease = std::move(lease);

    std::lock_guard<std::mutex> lock(working_mutex_);
    working_set_[key] = wp;
    return DsmError::OK;
}

DsmError MemoryManager::pin_for_read(const DsmContext &ctx, DsmArray &array, PageID page_id) {
    PageKey key{array.id(), page_id};
    {
        std::lock_guard<std::mutex> lock(pins_mutex_);
        auto it = read_pins_.find(key);
        if (it != read_pins_.end() && !it->second.expired(DsmClock::now())) {
            return DsmError::OK;
        }
    }

    Lease lease;
    NodeID owner;
    DsmError err = acquire_at_home(ctx, array, page_id, LeaseType::READ, lease, owner);
    if (err != DsmError::OK) {
        return err;
    }
    std::lock_guard<std::mutex> lock(pins_mutex_);
    read_pins_[key] = std::move(lease);
    return DsmError::OK;
}

size_t MemoryManager::release_read_pins(const DsmContext &ctx, const DsmArray &array) {
    std::vector<Lease> pins;
    {
        std::lock_guard<std::mutex> lock(pins_mutex_);
        for (auto it = read_pins_.begin(); it != read_pins_.end();) {
            if (it->first.array_id == array.id()) {
                pins.push_back(std::move(it->second));
                it = read_pins_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t released = 0;
    for (const auto &pin : pins) {
        DsmError err = release_at_home(ctx, array, pin.id);
        if (err == DsmError::OK) {
            released++;
        } else if (!benign_release_error(err)) {
            SPDLOG_WARN("Read pin {} on array {} page {} left to expire: {}", pin.id, array.id(), pin.page_id,
                        dsm_error_string(err));
        }
    }
    return released;
}

// ---- Element access ----

DsmStatus MemoryManager::read_element(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, ElementType type,
                                      const ArrayPolicy &policy, const PageAccessor &read) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return fail(err, array_id, -1, "read interrupted");
    }
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "unknown array");
    }
    if (array->element_type() != type) {
        return fail(DsmError::INVALID_ARGUMENT, array_id, -1,
                    fmt::format("array holds {} elements, read as {}", element_type_string(array->element_type()),
                                element_type_string(type)));
    }
    PageID page_id;
    int64_t element;
    if (array->locate(index, page_id, element) != DsmError::OK) {
        return fail(DsmError::OUT_OF_BOUNDS, array_id, -1,
                    fmt::format("index {} outside length {}", index, array->length()));
    }

    std::shared_lock<std::shared_mutex> phase(array->phase_mutex());
    PageKey key{array_id, page_id};

    std::shared_ptr<Page> page;
    {
        std::lock_guard<std::mutex> lock(working_mutex_);
        auto it = working_set_.find(key);
        if (it != working_set_.end()) {
            page = it->second.page;
        }
    }

    if (!page) {
        NodeID owner;
        if (!array->page_owner(page_id, owner)) {
            // Never written: reads as zero
            return DsmStatus::success();
        }
        if (owner != local_node() && policy.snapshot_reads) {
            err = pin_for_read(ctx, *array, page_id);
            if (err != DsmError::OK) {
                return fail(err, array_id, page_id, "read lease not granted");
            }
        }
        err = resolve_page(ctx, *array, page_id, 0, page);
        if (err != DsmError::OK) {
            return fail(err, array_id, page_id, fmt::format("page from {} unavailable", owner));
        }
    }

    err = read(*page, element);
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, fmt::format("element {} unreadable", element));
    }
    return DsmStatus::success();
}

DsmStatus MemoryManager::write_element(const DsmContext &ctx, const ArrayID &array_id, uint64_t index,
                                       ElementType type, const PageAccessor &write) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return fail(err, array_id, -1, "write interrupted");
    }
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "unknown array");
    }
    if (array->element_type() != type) {
        return fail(DsmError::INVALID_ARGUMENT, array_id, -1,
                    fmt::format("array holds {} elements, written as {}", element_type_string(array->element_type()),
                                element_type_string(type)));
    }
    PageID page_id;
    int64_t element;
    if (array->locate(index, page_id, element) != DsmError::OK) {
        return fail(DsmError::OUT_OF_BOUNDS, array_id, -1,
                    fmt::format("index {} outside length {}", index, array->length()));
    }

    std::shared_lock<std::shared_mutex> phase(array->phase_mutex());
    PageKey key{array_id, page_id};
    std::lock_guard<std::mutex> stripe(acquire_stripe(key));

    WorkingPage wp;
    bool have = false;
    {
        std::lock_guard<std::mutex> lock(working_mutex_);
        auto it = working_set_.find(key);
        if (it != working_set_.end()) {
            wp = it->second;
            have = true;
        }
    }

    if (have && wp.lease.expired(DsmClock::now())) {
        err = renew_write_lease(ctx, *array, page_id, wp);
        if (err != DsmError::OK) {
            return fail(err, array_id, page_id, "write lease expired and could not be renewed", wp.lease.id);
        }
    } else if (!have) {
        err = open_working_page(ctx, *array, page_id, wp);
        if (err != DsmError::OK) {
            return fail(err, array_id, page_id, "write lease not granted");
        }
        std::lock_guard<std::mutex> lock(working_mutex_);
        working_set_[key] = wp;
    }

    err = write(*wp.page, element);
    if (err != DsmError::OK) {
        return fail(err, array_id, page_id, fmt::format("element {} unwritable", element), wp.lease.id);
    }
    array->mark_touched(page_id);
    if (array->sync_state() == SyncState::SYNCED) {
        array->set_sync_state(SyncState::ACTIVE);
    }
    return DsmStatus::success();
}

DsmStatus MemoryManager::get_int64(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, int64_t &out,
                                   const ArrayPolicy &policy) {
    out = 0;
    return read_element(ctx, array_id, index, ElementType::INT64, policy,
                        [&out](Page &page, int64_t element) { return page.get_int64(element, out); });
}

DsmStatus MemoryManager::set_int64(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, int64_t value) {
    return write_element(ctx, array_id, index, ElementType::INT64,
                         [value](Page &page, int64_t element) { return page.set_int64(element, value); });
}

DsmStatus MemoryManager::get_float32(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, float &out,
                                     const ArrayPolicy &policy) {
    out = 0.0f;
    return read_element(ctx, array_id, index, ElementType::FLOAT32, policy,
                        [&out](Page &page, int64_t element) { return page.get_float32(element, out); });
}

DsmStatus MemoryManager::set_float32(const DsmContext &ctx, const ArrayID &array_id, uint64_t index, float value) {
    return write_element(ctx, array_id, index, ElementType::FLOAT32,
                         [value](Page &page, int64_t element) { return page.set_float32(element, value); });
}

// ---- Phase boundary ----

DsmStatus MemoryManager::sync(const DsmContext &ctx, const ArrayID &array_id, SyncReport *report) {
    SyncBarrier barrier(*this);
    return barrier.run(ctx, array_id, report);
}

bool MemoryManager::has_pending_writes(const ArrayID &array_id) const {
    auto array = get_array(array_id);
    if (array && array->touched_count() > 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(working_mutex_);
    for (const auto &entry : working_set_) {
        if (entry.first.array_id == array_id) {
            return true;
        }
    }
    return false;
}

DsmStatus MemoryManager::close_array(const DsmContext &ctx, const ArrayID &array_id) {
    auto array = get_array(array_id);
    if (!array) {
        return fail(DsmError::NOT_FOUND, array_id, -1, "close of unknown array");
    }

    if (has_pending_writes(array_id)) {
        DsmStatus status = sync(ctx, array_id);
        if (!status.ok()) {
            return status;
        }
    }

    size_t pins = release_read_pins(bounded(ctx), *array);
    size_t dropped = cache_.remove_array(array_id);
    SPDLOG_INFO("Closed array {} on {} ({} read lease(s) released, {} cached page(s) dropped)", array_id,
                local_node(), pins, dropped);
    return DsmStatus::success();
}

// ---- Membership ----

void MemoryManager::member_event_loop() {
    while (running_) {
        MemberEvent event;
        if (member_events_.wait_pop(event, std::chrono::milliseconds(100))) {
            handle_member_event(event);
        }
    }
}

size_t MemoryManager::process_member_events() {
    size_t handled = 0;
    MemberEvent event;
    while (member_events_.try_pop(event)) {
        handle_member_event(event);
        handled++;
    }
    return handled;
}

void MemoryManager::handle_member_event(const MemberEvent &event) {
    switch (event.type) {
    case MemberEventType::JOINED:
        SPDLOG_INFO("Node {} joined", event.node);
        return;
    case MemberEventType::SUSPECT:
        SPDLOG_WARN("Node {} is suspected; its leases will run out on their own", event.node);
        return;
    case MemberEventType::LEFT:
    case MemberEventType::FAILED:
        break;
    }

    if (event.node == local_node()) {
        SPDLOG_WARN("Ignoring {} event about this node", member_event_string(event.type));
        return;
    }

    size_t revoked = leases_.revoke_leases_held_by(event.node);

    std::vector<std::shared_ptr<DsmArray>> arrays;
    {
        std::shared_lock<std::shared_mutex> lock(arrays_mutex_);
        for (const auto &entry : arrays_) {
            arrays.push_back(entry.second);
        }
    }

    size_t unmapped = 0;
    for (const auto &array : arrays) {
        std::vector<PageID> dropped = array->drop_owner(event.node);
        drop_cached_pages(*array, dropped);
        unmapped += dropped.size();
    }
    SPDLOG_INFO("Node {} {}: revoked {} lease(s), unmapped {} page(s)", event.node,
                event.type == MemberEventType::FAILED ? "failed" : "left", revoked, unmapped);
}

// ---- Inbound protocol ----

void MemoryManager::handle_message(const DsmMessage &req, DsmMessage &resp) {
    SPDLOG_TRACE("{} from {} for array {} page {}", dsm_msg_type_string(req.type), req.src_node, req.array_id,
                 req.page_id);
    switch (req.type) {
    case DSM_MSG_PAGE_REQUEST:
        on_page_request(req, resp);
        break;
    case DSM_MSG_PAGE_PUSH:
        on_page_push(req, resp);
        break;
    case DSM_MSG_LEASE_ACQUIRE:
        on_lease_acquire(req, resp);
        break;
    case DSM_MSG_LEASE_RELEASE:
        on_lease_release(req, resp);
        break;
    case DSM_MSG_LEASE_VALIDATE:
        on_lease_validate(req, resp);
        break;
    case DSM_MSG_LEASE_REVOKE:
        on_lease_revoke(req, resp);
        break;
    case DSM_MSG_LEASE_ABANDON:
        on_lease_abandon(req, resp);
        break;
    case DSM_MSG_INVALIDATE:
        on_invalidate(req, resp);
        break;
    case DSM_MSG_ARRAY_INFO_REQUEST:
        on_array_info(req, resp);
        break;
    default:
        SPDLOG_WARN("Node {} cannot serve {} from {}", local_node(), dsm_msg_type_string(req.type), req.src_node);
        resp = make_reply(req, DSM_MSG_LEASE_ACK, local_node());
        resp.status = DsmError::PROTOCOL;
        break;
    }
}

void MemoryManager::on_page_request(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_PAGE_RESPONSE, local_node());
    auto array = get_array(req.array_id);
    if (!array) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }
    if (!array->valid_page(req.page_id)) {
        resp.status = DsmError::OUT_OF_BOUNDS;
        return;
    }
    NodeID owner;
    if (!array->page_owner(req.page_id, owner) || owner != local_node()) {
        SPDLOG_DEBUG("{} asked {} for array {} page {} it does not own", req.src_node, local_node(), req.array_id,
                     req.page_id);
        resp.status = DsmError::NOT_FOUND;
        return;
    }
    auto page = local_page(*array, req.page_id);
    resp.version = page->version();
    resp.page_data = page->snapshot();
}

void MemoryManager::on_page_push(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_PAGE_PUSH_ACK, local_node());
    auto array = get_array(req.array_id);
    if (!array) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }
    NodeID owner;
    if (!array->valid_page(req.page_id) || !array->page_owner(req.page_id, owner) || owner != local_node()) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }
    if (array->home_node() == local_node()) {
        Lease lease;
        resp.status = leases_.validate_lease(req.lease_id, lease);
        if (resp.status == DsmError::OK && (lease.type != LeaseType::WRITE || lease.page_id != req.page_id)) {
            resp.status = DsmError::CONFLICT;
        }
        if (resp.status != DsmError::OK) {
            SPDLOG_WARN("Rejecting push of array {} page {} from {}: {}", req.array_id, req.page_id, req.src_node,
                        dsm_error_string(resp.status));
            return;
        }
    }

    auto page = local_page(*array, req.page_id);
    resp.status = page->load(req.page_data.data(), req.page_data.size());
    if (resp.status != DsmError::OK) {
        return;
    }
    page->set_version(req.version);
    page->mark_clean();
    resp.version = req.version;
    SPDLOG_DEBUG("Accepted push of array {} page {} from {} at version {}", req.array_id, req.page_id, req.src_node,
                 req.version);
}

void MemoryManager::on_lease_acquire(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_LEASE_GRANT, local_node());
    auto array = get_array(req.array_id);
    if (!array || array->home_node() != local_node()) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }

    if (!req.lease_id.empty()) {
        std::lock_guard<std::mutex> lock(abandoned_mutex_);
        if (abandoned_.erase(req.lease_id) > 0) {
            SPDLOG_DEBUG("Lease request {} from {} was withdrawn before it arrived", req.lease_id, req.src_node);
            resp.status = DsmError::CANCELLED;
            return;
        }
    }

    const NodeID &requester = req.owner.empty() ? req.src_node : req.owner;
    Lease lease;
    NodeID page_owner;
    // Remote conflicts are answered at once, never queued here
    resp.status = grant_lease(DsmContext::background(), *array, req.page_id, req.lease_type, requester,
                              array->version(), lease, page_owner, req.lease_id);
    if (resp.status != DsmError::OK) {
        return;
    }
    resp.lease_id = lease.id;
    resp.lease_type = lease.type;
    resp.owner = lease.owner;
    resp.version = lease.version;
    resp.ttl_ms = remaining_ms(lease);
    resp.page_owner = page_owner;
}

void MemoryManager::on_lease_release(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_LEASE_ACK, local_node());
    resp.lease_id = req.lease_id;
    resp.status = leases_.release_lease(req.lease_id);
}

void MemoryManager::on_lease_validate(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_LEASE_ACK, local_node());
    resp.lease_id = req.lease_id;
    Lease lease;
    resp.status = leases_.validate_lease(req.lease_id, lease);
    if (resp.status == DsmError::OK) {
        resp.page_id = lease.page_id;
        resp.ttl_ms = remaining_ms(lease);
    }
}

void MemoryManager::on_lease_revoke(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_LEASE_ACK, local_node());
    resp.status = leases_.revoke_lease(req.array_id, req.page_id);
}

void MemoryManager::on_lease_abandon(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_LEASE_ACK, local_node());
    resp.lease_id = req.lease_id;
    auto array = get_array(req.array_id);
    if (!array || array->home_node() != local_node()) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }

    Lease lease;
    bool found = false;
    bool claimed = false;
    {
        std::lock_guard<std::mutex> lock(claim_mutex_);
        found = leases_.take_lease(req.lease_id, lease) == DsmError::OK;
        if (found && lease.claimed_page) {
            claimed = array->release_page_claim(lease.page_id, lease.owner);
        }
    }
    if (!found) {
        // The acquire is still on its way; refuse it when it lands
        auto now = DsmClock::now();
        std::lock_guard<std::mutex> lock(abandoned_mutex_);
        for (auto it = abandoned_.begin(); it != abandoned_.end();) {
            it = it->second < now ? abandoned_.erase(it) : std::next(it);
        }
        abandoned_[req.lease_id] = now + leases_.ttl();
        return;
    }
    SPDLOG_INFO("{} withdrew {} lease {} on array {} page {}{}", req.src_node, lease_type_string(lease.type), lease.id,
                req.array_id, lease.page_id, claimed ? ", page unmapped again" : "");
}

void MemoryManager::on_invalidate(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_INVALIDATE_ACK, local_node());
    total_invalidations_received_++;

    auto array = get_array(req.array_id);
    if (!array) {
        // Nothing cached for an array this node never opened
        return;
    }
    std::vector<PageID> pages;
    pages.reserve(req.owners.size());
    for (const auto &entry : req.owners) {
        pages.push_back(entry.first);
    }
    drop_cached_pages(*array, pages);
    array->merge_owners(req.owners);
    array->adopt_version(req.version);
    resp.version = array->version();
    SPDLOG_DEBUG("{} invalidated {} page(s) of array {} (version {})", req.src_node, req.owners.size(), req.array_id,
                 resp.version);
}

void MemoryManager::on_array_info(const DsmMessage &req, DsmMessage &resp) {
    resp = make_reply(req, DSM_MSG_ARRAY_INFO_RESPONSE, local_node());
    auto array = get_array(req.array_id);
    if (!array) {
        resp.status = DsmError::NOT_FOUND;
        return;
    }
    ArrayDescriptor desc = array->describe();
    resp.length = desc.length;
    resp.element_type = desc.element_type;
    resp.home_node = desc.home_node;
    resp.version = desc.version;
    resp.owners = std::move(desc.owners);
}

MemoryManager::Stats MemoryManager::get_stats() const {
    Stats stats;
    stats.local_reads = total_local_reads_.load();
    stats.remote_fetches = total_remote_fetches_.load();
    stats.remote_fetch_failures = total_remote_fetch_failures_.load();
    stats.pages_pushed = total_pages_pushed_.load();
    stats.syncs_completed = total_syncs_completed_.load();
    stats.invalidations_sent = total_invalidations_sent_.load();
    stats.invalidations_received = total_invalidations_received_.load();
    return stats;
}
