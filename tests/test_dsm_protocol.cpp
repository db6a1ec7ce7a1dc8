/*
 * Test: wire protocol
 *
 * Verifies the frame header layout, payload decoding for the message kinds
 * that carry page data and ownership, and rejection of malformed frames.
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_protocol.h"
#include "test_common.h"
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== HoloDSM Wire Protocol Test ===" << std::endl;
    TestResult results;

    phase("Phase 1: Header layout");
    {
        DsmMessage msg;
        msg.type = DSM_MSG_PAGE_REQUEST;
        msg.msg_id = 0x01020304;
        msg.src_node = "node-a";
        msg.array_id = "arr";
        msg.page_id = 3;
        msg.version = 2;
        std::vector<uint8_t> frame = encode_message(msg);

        results.check(frame.size() > DSM_MSG_HEADER_SIZE, "Frame carries a payload");
        results.check(frame[0] == 0x48 && frame[1] == 0x44 && frame[2] == 0x53 && frame[3] == 0x4D,
                      "Magic spells HDSM on the wire");
        results.check(frame[4] == DSM_MSG_PAGE_REQUEST && frame[5] == 0, "Type is little-endian");
        results.check(frame[8] == 0x04 && frame[11] == 0x01, "Message id is little-endian");

        dsm_msg_header_t header;
        results.check(decode_header(frame.data(), frame.size(), header) == DsmError::OK, "Header decodes");
        results.check(header.payload_size == frame.size() - DSM_MSG_HEADER_SIZE, "Payload size matches the frame");

        DsmMessage decoded;
        results.check(decode_message(frame, decoded) == DsmError::OK, "Frame decodes");
        results.check(decoded.src_node == "node-a" && decoded.array_id == "arr" && decoded.page_id == 3 &&
                          decoded.version == 2 && decoded.msg_id == 0x01020304,
                      "Request fields survive");
    }

    phase("Phase 2: Page data and ownership");
    {
        DsmMessage push;
        push.type = DSM_MSG_PAGE_PUSH;
        push.array_id = "arr";
        push.page_id = 1;
        push.version = 9;
        push.lease_id = "lease-1";
        push.page_data.assign(DSM_PAGE_SIZE, 0);
        push.page_data[0] = 0xAB;
        push.page_data[DSM_PAGE_SIZE - 1] = 0xCD;

        DsmMessage decoded;
        results.check(decode_message(encode_message(push), decoded) == DsmError::OK, "Page push decodes");
        results.check(decoded.lease_id == "lease-1" && decoded.page_data.size() == DSM_PAGE_SIZE &&
                          decoded.page_data[0] == 0xAB && decoded.page_data[DSM_PAGE_SIZE - 1] == 0xCD,
                      "Page bytes and lease survive");

        DsmMessage inval;
        inval.type = DSM_MSG_INVALIDATE;
        inval.array_id = "arr";
        inval.version = 4;
        inval.owners = {{0, "node-a"}, {2, ""}};
        results.check(decode_message(encode_message(inval), decoded) == DsmError::OK, "Invalidate decodes");
        results.check(decoded.owners.size() == 2 && decoded.owners[0].second == "node-a" &&
                          decoded.owners[1].first == 2 && decoded.owners[1].second.empty(),
                      "Owner list survives, including unmapped entries");

        DsmMessage grant;
        grant.type = DSM_MSG_LEASE_GRANT;
        grant.status = DsmError::CONFLICT;
        grant.lease_type = LeaseType::WRITE;
        grant.ttl_ms = 1500;
        grant.page_owner = "node-b";
        results.check(decode_message(encode_message(grant), decoded) == DsmError::OK, "Lease grant decodes");
        results.check(decoded.status == DsmError::CONFLICT && decoded.lease_type == LeaseType::WRITE &&
                          decoded.ttl_ms == 1500 && decoded.page_owner == "node-b",
                      "Grant status and fields survive");

        DsmMessage acquire;
        acquire.type = DSM_MSG_LEASE_ACQUIRE;
        acquire.array_id = "arr";
        acquire.page_id = 2;
        acquire.lease_type = LeaseType::WRITE;
        acquire.owner = "node-c";
        acquire.lease_id = "token-1";
        results.check(decode_message(encode_message(acquire), decoded) == DsmError::OK, "Lease acquire decodes");
        results.check(decoded.lease_id == "token-1" && decoded.owner == "node-c" && decoded.page_id == 2,
                      "Acquire carries the requester's lease name");

        DsmMessage abandon;
        abandon.type = DSM_MSG_LEASE_ABANDON;
        abandon.array_id = "arr";
        abandon.page_id = 2;
        abandon.lease_id = "token-1";
        results.check(decode_message(encode_message(abandon), decoded) == DsmError::OK, "Lease abandon decodes");
        results.check(decoded.type == DSM_MSG_LEASE_ABANDON && decoded.lease_id == "token-1" && decoded.page_id == 2,
                      "Abandon names the withdrawn lease");
        results.check(std::string(dsm_msg_type_string(DSM_MSG_LEASE_ABANDON)) == "LEASE_ABANDON",
                      "Abandon has a printable name");
    }

    phase("Phase 3: Malformed frames");
    {
        DsmMessage msg;
        msg.type = DSM_MSG_LEASE_RELEASE;
        msg.array_id = "arr";
        msg.lease_id = "lease-2";
        std::vector<uint8_t> frame = encode_message(msg);
        DsmMessage decoded;

        std::vector<uint8_t> bad_magic = frame;
        bad_magic[0] ^= 0xFF;
        results.check(decode_message(bad_magic, decoded) == DsmError::PROTOCOL, "Bad magic is PROTOCOL");

        std::vector<uint8_t> short_header(frame.begin(), frame.begin() + 10);
        results.check(decode_message(short_header, decoded) == DsmError::PROTOCOL, "Truncated header is PROTOCOL");

        std::vector<uint8_t> short_payload(frame.begin(), frame.end() - 1);
        results.check(decode_message(short_payload, decoded) == DsmError::PROTOCOL, "Truncated payload is PROTOCOL");

        std::vector<uint8_t> trailing = frame;
        trailing.push_back(0);
        trailing[12] += 1;
        results.check(decode_message(trailing, decoded) == DsmError::PROTOCOL, "Trailing bytes are PROTOCOL");

        std::vector<uint8_t> bad_status = frame;
        bad_status[6] = 200;
        results.check(decode_message(bad_status, decoded) == DsmError::PROTOCOL, "Unknown status is PROTOCOL");

        std::vector<uint8_t> bad_type = frame;
        bad_type[4] = 99;
        results.check(decode_message(bad_type, decoded) == DsmError::PROTOCOL, "Unknown type is PROTOCOL");

        std::vector<uint8_t> huge = frame;
        huge[12] = 0x00;
        huge[13] = 0x00;
        huge[14] = 0x20;
        huge[15] = 0x00;
        results.check(decode_message(huge, decoded) == DsmError::PROTOCOL, "Oversized payload is PROTOCOL");

        DsmMessage push;
        push.type = DSM_MSG_PAGE_PUSH;
        push.array_id = "arr";
        push.page_data.assign(DSM_PAGE_SIZE - 1, 0);
        results.check(decode_message(encode_message(push), decoded) == DsmError::PROTOCOL,
                      "Page of the wrong size is PROTOCOL");
    }

    phase("Phase 4: Replies");
    {
        DsmMessage req;
        req.type = DSM_MSG_PAGE_REQUEST;
        req.msg_id = 77;
        req.src_node = "node-a";
        req.array_id = "arr";
        req.page_id = 5;
        DsmMessage reply = make_reply(req, DSM_MSG_PAGE_RESPONSE, "node-b");
        results.check(reply.type == DSM_MSG_PAGE_RESPONSE && reply.msg_id == 77 && reply.array_id == "arr" &&
                          reply.page_id == 5 && reply.src_node == "node-b",
                      "Reply echoes the request identity");
        results.check(std::string(dsm_msg_type_string(DSM_MSG_INVALIDATE)) == "INVALIDATE", "Type names");
    }

    return results.summary();
}
