/*
 * HoloDSM page storage implementation
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "page_storage.h"
#include <cstring>
#include <spdlog/spdlog.h>

namespace {

uint64_t load_le64(const uint8_t *p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) {
        v = (v << 8) | p[i];
    }
    return v;
}

void store_le64(uint8_t *p, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint32_t load_le32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void store_le32(uint8_t *p, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

} // namespace

PageStorage::PageStorage(size_t size) : data_(size, 0) {}

DsmError PageStorage::get_int64(int64_t offset, int64_t &out) const {
    if (!in_bounds(offset, 8)) {
        SPDLOG_DEBUG("int64 read at offset {} outside page of {} bytes", offset, data_.size());
        return DsmError::OUT_OF_BOUNDS;
    }
    out = static_cast<int64_t>(load_le64(&data_[offset]));
    return DsmError::OK;
}

DsmError PageStorage::set_int64(int64_t offset, int64_t value) {
    if (!in_bounds(offset, 8)) {
        SPDLOG_DEBUG("int64 write at offset {} outside page of {} bytes", offset, data_.size());
        return DsmError::OUT_OF_BOUNDS;
    }
    store_le64(&data_[offset], static_cast<uint64_t>(value));
    return DsmError::OK;
}

DsmError PageStorage::get_float32(int64_t offset, float &out) const {
    if (!in_bounds(offset, 4)) {
        SPDLOG_DEBUG("float32 read at offset {} outside page of {} bytes", offset, data_.size());
        return DsmError::OUT_OF_BOUNDS;
    }
    uint32_t bits = load_le32(&data_[offset]);
    std::memcpy(&out, &bits, sizeof(out));
    return DsmError::OK;
}

DsmError PageStorage::set_float32(int64_t offset, float value) {
    if (!in_bounds(offset, 4)) {
        SPDLOG_DEBUG("float32 write at offset {} outside page of {} bytes", offset, data_.size());
        return DsmError::OUT_OF_BOUNDS;
    }
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store_le32(&data_[offset], bits);
    return DsmError::OK;
}

DsmError PageStorage::copy_from(const uint8_t *data, size_t size) {
    if (size != data_.size()) {
        SPDLOG_ERROR("Page size mismatch: got {} bytes, expected {}", size, data_.size());
        return DsmError::PROTOCOL;
    }
    std::memcpy(data_.data(), data, size);
    return DsmError::OK;
}

void PageStorage::copy_to(std::vector<uint8_t> &out) const { out.assign(data_.begin(), data_.end()); }
