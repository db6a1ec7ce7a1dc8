/*
 * HoloDSM shared array handle implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "shared_array.h"
#include <algorithm>
#include <fmt/format.h>

SharedArray::SharedArray(MemoryManager &manager, std::shared_ptr<DsmArray> array, ArrayPolicy policy)
    : manager_(&manager), array_(std::move(array)), policy_(policy), begin_(0), end_(array_->length()) {}

DsmStatus SharedArray::create(MemoryManager &manager, const DsmContext &ctx, uint64_t length, ElementType type,
                              ArrayPolicy policy, std::unique_ptr<SharedArray> &out) {
    std::shared_ptr<DsmArray> array;
    DsmStatus status = manager.create_array(ctx, length, type, array);
    if (!status.ok()) {
        return status;
    }
    out = std::make_unique<SharedArray>(manager, std::move(array), policy);
    return status;
}

DsmStatus SharedArray::open(MemoryManager &manager, const DsmContext &ctx, const ArrayID &array_id,
                            const NodeID &home_node, ArrayPolicy policy, std::unique_ptr<SharedArray> &out) {
    std::shared_ptr<DsmArray> array;
    DsmStatus status = manager.open_array(ctx, array_id, home_node, array);
    if (!status.ok()) {
        return status;
    }
    out = std::make_unique<SharedArray>(manager, std::move(array), policy);
    return status;
}

DsmStatus SharedArray::check_index(uint64_t index) const {
    if (closed_) {
        return report_failure(DsmStatus::failure(DsmError::INVALID_ARGUMENT, id(), -1, "handle is closed"));
    }
    if (index >= length()) {
        return report_failure(DsmStatus::failure(DsmError::OUT_OF_BOUNDS, id(), -1,
                                                 fmt::format("index {} outside view of {}", index, length())));
    }
    return DsmStatus::success();
}

DsmStatus SharedArray::get_int64(const DsmContext &ctx, uint64_t index, int64_t &out) {
    DsmStatus status = check_index(index);
    if (!status.ok()) {
        return status;
    }
    return manager_->get_int64(ctx, id(), begin_ + index, out, policy_);
}

DsmStatus SharedArray::set_int64(const DsmContext &ctx, uint64_t index, int64_t value) {
    DsmStatus status = check_index(index);
    if (!status.ok()) {
        return status;
    }
    return manager_->set_int64(ctx, id(), begin_ + index, value);
}

DsmStatus SharedArray::get_float32(const DsmContext &ctx, uint64_t index, float &out) {
    DsmStatus status = check_index(index);
    if (!status.ok()) {
        return status;
    }
    return manager_->get_float32(ctx, id(), begin_ + index, out, policy_);
}

DsmStatus SharedArray::set_float32(const DsmContext &ctx, uint64_t index, float value) {
    DsmStatus status = check_index(index);
    if (!status.ok()) {
        return status;
    }
    return manager_->set_float32(ctx, id(), begin_ + index, value);
}

SharedArray SharedArray::slice(uint64_t begin, uint64_t end) const {
    uint64_t e = std::min(end, length());
    uint64_t b = std::min(begin, e);
    SharedArray view(*this);
    view.begin_ = begin_ + b;
    view.end_ = begin_ + e;
    return view;
}

DsmStatus SharedArray::sync(const DsmContext &ctx, SyncReport *report) {
    if (closed_) {
        return report_failure(DsmStatus::failure(DsmError::INVALID_ARGUMENT, id(), -1, "handle is closed"));
    }
    return manager_->sync(ctx, id(), report);
}

DsmStatus SharedArray::close(const DsmContext &ctx) {
    if (closed_) {
        return DsmStatus::success();
    }
    DsmStatus status = manager_->close_array(ctx, id());
    if (status.ok()) {
        closed_ = true;
    }
    return status;
}
