/*
 * HoloDSM wire protocol
 *
 * Every frame is a 16-byte header followed by a type-specific payload.
 * Integers are little-endian, strings carry a u16 length prefix and page
 * bytes a u32 length prefix. A page payload whose length differs from
 * DSM_PAGE_SIZE is a protocol error.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#ifndef HOLODSM_DSM_PROTOCOL_H
#define HOLODSM_DSM_PROTOCOL_H

#include "dsm_types.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#define DSM_MSG_MAGIC 0x4D534448U /* "HDSM" */
#define DSM_MSG_HEADER_SIZE 16
#define DSM_MAX_PAYLOAD (1024 * 1024)

typedef enum {
    DSM_MSG_NONE = 0,

    /* Page data */
    DSM_MSG_PAGE_REQUEST = 1,
    DSM_MSG_PAGE_RESPONSE = 2,
    DSM_MSG_PAGE_PUSH = 3,
    DSM_MSG_PAGE_PUSH_ACK = 4,

    /* Lease control, addressed to the array's home node */
    DSM_MSG_LEASE_ACQUIRE = 10,
    DSM_MSG_LEASE_GRANT = 11,
    DSM_MSG_LEASE_RELEASE = 12,
    DSM_MSG_LEASE_VALIDATE = 13,
    DSM_MSG_LEASE_REVOKE = 14,
    DSM_MSG_LEASE_ACK = 15,
    // Requester gave up on an acquire; undoes the grant if it happened
    DSM_MSG_LEASE_ABANDON = 16,

    /* Sync barrier */
    DSM_MSG_INVALIDATE = 20,
    DSM_MSG_INVALIDATE_ACK = 21,

    /* Array discovery */
    DSM_MSG_ARRAY_INFO_REQUEST = 30,
    DSM_MSG_ARRAY_INFO_RESPONSE = 31,
} dsm_msg_type_t;

const char *dsm_msg_type_string(uint16_t type);

/* Fixed frame header (16 bytes on the wire) */
typedef struct {
    uint32_t magic;
    uint16_t msg_type;
    uint8_t status;
    uint8_t reserved;
    uint32_t msg_id;
    uint32_t payload_size;
} __attribute__((packed)) dsm_msg_header_t;

static_assert(sizeof(dsm_msg_header_t) == DSM_MSG_HEADER_SIZE, "header layout is part of the wire contract");

/*
 * Decoded message. Only the fields relevant to `type` travel on the wire;
 * the rest keep their defaults after decoding.
 */
struct DsmMessage {
    uint16_t type = DSM_MSG_NONE;
    DsmError status = DsmError::OK;
    uint32_t msg_id = 0;

    NodeID src_node;
    ArrayID array_id;
    PageID page_id = -1;
    Version version = 0;

    // Lease control
    LeaseID lease_id;
    LeaseType lease_type = LeaseType::READ;
    std::string owner;
    uint32_t ttl_ms = 0;
    NodeID page_owner;

    // PAGE_RESPONSE / PAGE_PUSH
    std::vector<uint8_t> page_data;

    // ARRAY_INFO_RESPONSE / INVALIDATE
    uint64_t length = 0;
    ElementType element_type = ElementType::INT64;
    NodeID home_node;
    std::vector<std::pair<PageID, NodeID>> owners;
};

// Builds a reply skeleton addressed back to the sender of `req`
DsmMessage make_reply(const DsmMessage &req, uint16_t reply_type, const NodeID &local_node);

std::vector<uint8_t> encode_message(const DsmMessage &msg);
DsmError decode_header(const uint8_t *data, size_t size, dsm_msg_header_t &header);
DsmError decode_payload(const dsm_msg_header_t &header, const uint8_t *payload, size_t size, DsmMessage &msg);
// Header + payload in one buffer
DsmError decode_message(const std::vector<uint8_t> &frame, DsmMessage &msg);

#endif // HOLODSM_DSM_PROTOCOL_H
