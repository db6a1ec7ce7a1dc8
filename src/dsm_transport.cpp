/*
 * HoloDSM transport request helper
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_transport.h"
#include <spdlog/spdlog.h>

DsmError DsmTransport::request(const DsmContext &ctx, const NodeID &peer, DsmMessage &req, DsmMessage &resp) {
    DsmError err = ctx.check();
    if (err != DsmError::OK) {
        return err;
    }

    req.src_node = local_node();
    req.msg_id = next_msg_id_.fetch_add(1);

    std::unique_ptr<DsmStream> stream;
    err = open_stream(ctx, peer, stream);
    if (err != DsmError::OK) {
        SPDLOG_DEBUG("Cannot open stream to {} for {}: {}", peer, dsm_msg_type_string(req.type),
                     dsm_error_string(err));
        return err;
    }

    err = stream->write_message(ctx, req);
    if (err == DsmError::OK) {
        err = stream->read_message(ctx, resp);
    }
    stream->close();

    if (err != DsmError::OK) {
        SPDLOG_DEBUG("{} to {} failed: {}", dsm_msg_type_string(req.type), peer, dsm_error_string(err));
        return err;
    }
    if (resp.msg_id != req.msg_id) {
        SPDLOG_ERROR("Reply from {} carries msg_id {}, expected {}", peer, resp.msg_id, req.msg_id);
        return DsmError::PROTOCOL;
    }
    return DsmError::OK;
}
