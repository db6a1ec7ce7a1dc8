/*
 * HoloDSM common types
 *
 * Identifiers, error codes and the cancellation/deadline context shared by
 * every component of the coherence engine.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_DSM_TYPES_H
#define HOLODSM_DSM_TYPES_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Page size is part of the wire contract with remote peers
constexpr size_t DSM_PAGE_SIZE = 64 * 1024;

using ArrayID = std::string;
using LeaseID = std::string;
using NodeID = std::string;
using PageID = int32_t;
using Version = int64_t;

using DsmClock = std::chrono::steady_clock;

enum class DsmError : uint8_t {
    OK = 0,
    CONFLICT = 1,
    NOT_FOUND = 2,
    EXPIRED = 3,
    OUT_OF_BOUNDS = 4,
    UNREACHABLE = 5,
    TIMEOUT = 6,
    CANCELLED = 7,
    PROTOCOL = 8,
    INVALID_ARGUMENT = 9,
};

const char *dsm_error_string(DsmError err);

// Retry policy stays with the caller; this only classifies
inline bool dsm_error_retryable(DsmError err) {
    return err == DsmError::CONFLICT || err == DsmError::UNREACHABLE || err == DsmError::TIMEOUT ||
           err == DsmError::EXPIRED;
}

enum class ElementType : uint8_t {
    INT64 = 0,
    FLOAT32 = 1,
};

inline size_t element_size(ElementType type) { return type == ElementType::FLOAT32 ? 4 : 8; }
const char *element_type_string(ElementType type);

enum class LeaseType : uint8_t {
    READ = 0,
    WRITE = 1,
};

const char *lease_type_string(LeaseType type);

/* (ArrayID, PageID) pair used to key leases, cache entries and local pages */
struct PageKey {
    ArrayID array_id;
    PageID page_id;

    bool operator==(const PageKey &other) const {
        return page_id == other.page_id && array_id == other.array_id;
    }
};

struct PageKeyHash {
    size_t operator()(const PageKey &key) const {
        size_t h = std::hash<std::string>{}(key.array_id);
        return h ^ (std::hash<int32_t>{}(key.page_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/*
 * Deadline and cancellation carried by every potentially blocking call.
 * A default context never expires and cannot be cancelled.
 */
class DsmContext {
public:
    DsmContext() = default;

    static DsmContext background() { return DsmContext(); }
    static DsmContext with_timeout(std::chrono::milliseconds timeout);
    static DsmContext with_deadline(DsmClock::time_point deadline);

    // Returns a copy sharing the cancel flag, with the deadline tightened to `timeout` from now
    DsmContext child(std::chrono::milliseconds timeout) const;

    // Cancelling any copy cancels all copies that share the flag
    DsmContext &attach_cancel_flag(std::shared_ptr<std::atomic<bool>> flag);
    void cancel() const;

    bool has_deadline() const { return deadline_ != DsmClock::time_point::max(); }
    DsmClock::time_point deadline() const { return deadline_; }
    bool cancelled() const { return cancel_flag_ && cancel_flag_->load(std::memory_order_acquire); }
    bool expired() const { return has_deadline() && DsmClock::now() >= deadline_; }
    std::chrono::milliseconds remaining() const;

    // CANCELLED, TIMEOUT or OK
    DsmError check() const;

private:
    DsmClock::time_point deadline_ = DsmClock::time_point::max();
    std::shared_ptr<std::atomic<bool>> cancel_flag_;
};

/* Failure detail returned by orchestration-level calls */
struct DsmStatus {
    DsmError code = DsmError::OK;
    ArrayID array_id;
    PageID page_id = -1;
    LeaseID lease_id;
    std::string message;

    bool ok() const { return code == DsmError::OK; }
    std::string describe() const;

    static DsmStatus success() { return DsmStatus(); }
    static DsmStatus failure(DsmError code, const ArrayID &array_id, PageID page_id, std::string message,
                             const LeaseID &lease_id = "");
};

// Random RFC 4122 version 4 identifier used for arrays and leases
std::string generate_uuid();

#endif // HOLODSM_DSM_TYPES_H
