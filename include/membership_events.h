/*
 * HoloDSM membership event channel
 *
 * The external membership component publishes liveness changes here; the
 * memory manager drains them to revoke leases and forget ownership held by
 * departed nodes.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_MEMBERSHIP_EVENTS_H
#define HOLODSM_MEMBERSHIP_EVENTS_H

#include "dsm_types.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

enum class MemberEventType : uint8_t {
    JOINED = 0,
    LEFT = 1,
    FAILED = 2,
    SUSPECT = 3,
};

const char *member_event_string(MemberEventType type);

struct MemberEvent {
    MemberEventType type;
    NodeID node;
};

class MemberEventChannel {
public:
    MemberEventChannel() = default;
    MemberEventChannel(const MemberEventChannel &) = delete;
    MemberEventChannel &operator=(const MemberEventChannel &) = delete;

    // Returns false once the channel is closed
    bool publish(MemberEventType type, const NodeID &node);
    bool try_pop(MemberEvent &out);
    // Waits up to `timeout`; false on timeout or when closed and drained
    bool wait_pop(MemberEvent &out, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    size_t pending() const;

private:
    std::deque<MemberEvent> queue_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

#endif // HOLODSM_MEMBERSHIP_EVENTS_H
