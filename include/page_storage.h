/*
 * HoloDSM page storage
 *
 * Fixed-size byte buffer with little-endian, bounds-checked typed accessors.
 * Offsets are byte offsets; callers convert element indices.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_PAGE_STORAGE_H
#define HOLODSM_PAGE_STORAGE_H

#include "dsm_types.h"
#include <cstdint>
#include <vector>

class PageStorage {
public:
    explicit PageStorage(size_t size = DSM_PAGE_SIZE);

    DsmError get_int64(int64_t offset, int64_t &out) const;
    DsmError set_int64(int64_t offset, int64_t value);
    DsmError get_float32(int64_t offset, float &out) const;
    DsmError set_float32(int64_t offset, float value);

    // Whole-buffer transfer; a size mismatch is a protocol error
    DsmError copy_from(const uint8_t *data, size_t size);
    void copy_to(std::vector<uint8_t> &out) const;

    const uint8_t *data() const { return data_.data(); }
    size_t size() const { return data_.size(); }

private:
    bool in_bounds(int64_t offset, size_t width) const {
        return offset >= 0 && static_cast<uint64_t>(offset) + width <= data_.size();
    }

    std::vector<uint8_t> data_;
};

#endif // HOLODSM_PAGE_STORAGE_H
