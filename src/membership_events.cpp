/*
 * HoloDSM membership event channel implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "membership_events.h"
#include <spdlog/spdlog.h>

const char *member_event_string(MemberEventType type) {
    switch (type) {
    case MemberEventType::JOINED:
        return "JOINED";
    case MemberEventType::LEFT:
        return "LEFT";
    case MemberEventType::FAILED:
        return "FAILED";
    case MemberEventType::SUSPECT:
        return "SUSPECT";
    }
    return "UNKNOWN";
}

bool MemberEventChannel::publish(MemberEventType type, const NodeID &node) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            SPDLOG_DEBUG("Dropping {} event for {}: channel closed", member_event_string(type), node);
            return false;
        }
        queue_.push_back(MemberEvent{type, node});
    }
    cv_.notify_one();
    return true;
}

bool MemberEventChannel::try_pop(MemberEvent &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool MemberEventChannel::wait_pop(MemberEvent &out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void MemberEventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MemberEventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t MemberEventChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
