/*
 * HoloDSM common types implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_types.h"
#include <fmt/format.h>
#include <mutex>
#include <random>

const char *dsm_error_string(DsmError err) {
    switch (err) {
    case DsmError::OK:
        return "OK";
    case DsmError::CONFLICT:
        return "CONFLICT";
    case DsmError::NOT_FOUND:
        return "NOT_FOUND";
    case DsmError::EXPIRED:
        return "EXPIRED";
    case DsmError::OUT_OF_BOUNDS:
        return "OUT_OF_BOUNDS";
    case DsmError::UNREACHABLE:
        return "UNREACHABLE";
    case DsmError::TIMEOUT:
        return "TIMEOUT";
    case DsmError::CANCELLED:
        return "CANCELLED";
    case DsmError::PROTOCOL:
        return "PROTOCOL";
    case DsmError::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

const char *element_type_string(ElementType type) {
    switch (type) {
    case ElementType::INT64:
        return "int64";
    case ElementType::FLOAT32:
        return "float32";
    }
    return "unknown";
}

const char *lease_type_string(LeaseType type) { return type == LeaseType::WRITE ? "write" : "read"; }

DsmContext DsmContext::with_timeout(std::chrono::milliseconds timeout) {
    DsmContext ctx;
    ctx.deadline_ = DsmClock::now() + timeout;
    return ctx;
}

DsmContext DsmContext::with_deadline(DsmClock::time_point deadline) {
    DsmContext ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

DsmContext DsmContext::child(std::chrono::milliseconds timeout) const {
    DsmContext ctx = *this;
    auto candidate = DsmClock::now() + timeout;
    if (candidate < ctx.deadline_) {
        ctx.deadline_ = candidate;
    }
    return ctx;
}

DsmContext &DsmContext::attach_cancel_flag(std::shared_ptr<std::atomic<bool>> flag) {
    cancel_flag_ = std::move(flag);
    return *this;
}

void DsmContext::cancel() const {
    if (cancel_flag_) {
        cancel_flag_->store(true, std::memory_order_release);
    }
}

std::chrono::milliseconds DsmContext::remaining() const {
    if (!has_deadline()) {
        return std::chrono::milliseconds::max();
    }
    auto now = DsmClock::now();
    if (now >= deadline_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

DsmError DsmContext::check() const {
    if (cancelled()) {
        return DsmError::CANCELLED;
    }
    if (expired()) {
        return DsmError::TIMEOUT;
    }
    return DsmError::OK;
}

std::string DsmStatus::describe() const {
    std::string out = dsm_error_string(code);
    if (!array_id.empty()) {
        out += fmt::format(" array={}", array_id);
    }
    if (page_id >= 0) {
        out += fmt::format(" page={}", page_id);
    }
    if (!lease_id.empty()) {
        out += fmt::format(" lease={}", lease_id);
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

DsmStatus DsmStatus::failure(DsmError code, const ArrayID &array_id, PageID page_id, std::string message,
                             const LeaseID &lease_id) {
    DsmStatus status;
    status.code = code;
    status.array_id = array_id;
    status.page_id = page_id;
    status.lease_id = lease_id;
    status.message = std::move(message);
    return status;
}

std::string generate_uuid() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng();
        lo = rng();
    }
    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF), static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48), lo & 0xFFFFFFFFFFFFULL);
}
