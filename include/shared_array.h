/*
 * HoloDSM shared array handle
 *
 * Caller-facing view of an array through one node's MemoryManager. A handle
 * covers [begin, end) of the underlying array; slices share the array and
 * its coherence state. Visibility between nodes is only guaranteed across
 * sync(): Set, Sync, then Get.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_SHARED_ARRAY_H
#define HOLODSM_SHARED_ARRAY_H

#include "memory_manager.h"
#include <memory>

class SharedArray {
public:
    SharedArray(MemoryManager &manager, std::shared_ptr<DsmArray> array, ArrayPolicy policy = ArrayPolicy());

    // Creates a fresh array homed on `manager`'s node
    static DsmStatus create(MemoryManager &manager, const DsmContext &ctx, uint64_t length, ElementType type,
                            ArrayPolicy policy, std::unique_ptr<SharedArray> &out);
    // Attaches to an array homed elsewhere
    static DsmStatus open(MemoryManager &manager, const DsmContext &ctx, const ArrayID &array_id,
                          const NodeID &home_node, ArrayPolicy policy, std::unique_ptr<SharedArray> &out);

    const ArrayID &id() const { return array_->id(); }
    uint64_t length() const { return end_ - begin_; }
    uint64_t offset() const { return begin_; }
    ElementType element_type() const { return array_->element_type(); }
    const ArrayPolicy &policy() const { return policy_; }
    bool closed() const { return closed_; }

    DsmStatus get_int64(const DsmContext &ctx, uint64_t index, int64_t &out);
    DsmStatus set_int64(const DsmContext &ctx, uint64_t index, int64_t value);
    DsmStatus get_float32(const DsmContext &ctx, uint64_t index, float &out);
    DsmStatus set_float32(const DsmContext &ctx, uint64_t index, float value);

    // Bounds are relative to this view and clamp to it
    SharedArray slice(uint64_t begin, uint64_t end) const;

    DsmStatus sync(const DsmContext &ctx, SyncReport *report = nullptr);
    DsmStatus close(const DsmContext &ctx);

private:
    DsmStatus check_index(uint64_t index) const;

    MemoryManager *manager_;
    std::shared_ptr<DsmArray> array_;
    ArrayPolicy policy_;
    uint64_t begin_;
    uint64_t end_;
    bool closed_ = false;
};

#endif // HOLODSM_SHARED_ARRAY_H
