/*
 * HoloDSM page implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "page.h"
#include <limits>
#include <mutex>

namespace {

// Element index to byte offset, rejecting overflow as out of bounds
bool element_offset(int64_t element_index, int64_t width, int64_t &offset) {
    if (element_index < 0 || element_index > std::numeric_limits<int64_t>::max() / width) {
        offset = -1;
        return false;
    }
    offset = element_index * width;
    return true;
}

} // namespace

Page::Page(const ArrayID &array_id, PageID page_id, Version version, size_t page_size)
    : array_id_(array_id), page_id_(page_id), version_(version), storage_(page_size) {}

DsmError Page::get_int64(int64_t element_index, int64_t &out) const {
    int64_t offset;
    if (!element_offset(element_index, 8, offset)) return DsmError::OUT_OF_BOUNDS;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return storage_.get_int64(offset, out);
}

DsmError Page::set_int64(int64_t element_index, int64_t value) {
    int64_t offset;
    if (!element_offset(element_index, 8, offset)) return DsmError::OUT_OF_BOUNDS;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    DsmError err = storage_.set_int64(offset, value);
    if (err == DsmError::OK) {
        dirty_.store(true, std::memory_order_release);
    }
    return err;
}

DsmError Page::get_float32(int64_t element_index, float &out) const {
    int64_t offset;
    if (!element_offset(element_index, 4, offset)) return DsmError::OUT_OF_BOUNDS;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return storage_.get_float32(offset, out);
}

DsmError Page::set_float32(int64_t element_index, float value) {
    int64_t offset;
    if (!element_offset(element_index, 4, offset)) return DsmError::OUT_OF_BOUNDS;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    DsmError err = storage_.set_float32(offset, value);
    if (err == DsmError::OK) {
        dirty_.store(true, std::memory_order_release);
    }
    return err;
}

DsmError Page::load(const uint8_t *data, size_t size) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return storage_.copy_from(data, size);
}

std::vector<uint8_t> Page::snapshot() const {
    std::vector<uint8_t> out;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    storage_.copy_to(out);
    return out;
}

std::shared_ptr<Page> Page::clone() const {
    auto copy = std::make_shared<Page>(array_id_, page_id_, version(), storage_.size());
    std::shared_lock<std::shared_mutex> lock(mutex_);
    copy->storage_ = storage_;
    return copy;
}
