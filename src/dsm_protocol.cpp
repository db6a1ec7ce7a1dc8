/*
 * HoloDSM wire protocol codec
 *
 * SPDX-License-Identifier: (LGPL-2.1 OR BSD-2-Clause)
 * Copyright 2025 Regents of the University of California
 * UC Santa Cruz Sluglab.
 */

#include "dsm_protocol.h"
#include <cstring>
#include <limits>
#include <spdlog/spdlog.h>

namespace {

class PayloadWriter {
public:
    explicit PayloadWriter(std::vector<uint8_t> &out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(v); }
    void u16(uint16_t v) { put(v, 2); }
    void u32(uint32_t v) { put(v, 4); }
    void u64(uint64_t v) { put(v, 8); }
    void i32(int32_t v) { u32(static_cast<uint32_t>(v)); }
    void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

    void str(const std::string &s) {
        size_t n = std::min<size_t>(s.size(), std::numeric_limits<uint16_t>::max());
        u16(static_cast<uint16_t>(n));
        out_.insert(out_.end(), s.begin(), s.begin() + n);
    }

    void bytes(const std::vector<uint8_t> &b) {
        u32(static_cast<uint32_t>(b.size()));
        out_.insert(out_.end(), b.begin(), b.end());
    }

    void owners(const std::vector<std::pair<PageID, NodeID>> &entries) {
        u32(static_cast<uint32_t>(entries.size()));
        for (const auto &[page_id, owner] : entries) {
            i32(page_id);
            str(owner);
        }
    }

private:
    void put(uint64_t v, int width) {
        for (int i = 0; i < width; i++) {
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    std::vector<uint8_t> &out_;
};

class PayloadReader {
public:
    PayloadReader(const uint8_t *data, size_t size) : data_(data), size_(size) {}

    bool ok() const { return ok_; }
    bool exhausted() const { return pos_ == size_; }

    uint8_t u8() { return static_cast<uint8_t>(get(1)); }
    uint16_t u16() { return static_cast<uint16_t>(get(2)); }
    uint32_t u32() { return static_cast<uint32_t>(get(4)); }
    uint64_t u64() { return get(8); }
    int32_t i32() { return static_cast<int32_t>(u32()); }
    int64_t i64() { return static_cast<int64_t>(u64()); }

    std::string str() {
        uint16_t n = u16();
        if (!need(n)) return {};
        std::string s(reinterpret_cast<const char *>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::vector<uint8_t> bytes() {
        uint32_t n = u32();
        if (!need(n)) return {};
        std::vector<uint8_t> b(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return b;
    }

    std::vector<std::pair<PageID, NodeID>> owners() {
        std::vector<std::pair<PageID, NodeID>> entries;
        uint32_t count = u32();
        // Each entry needs at least 6 bytes; reject absurd counts before reserving
        if (!ok_ || count > (size_ - pos_) / 6) {
            ok_ = false;
            return entries;
        }
        entries.reserve(count);
        for (uint32_t i = 0; i < count && ok_; i++) {
            PageID page_id = i32();
            NodeID owner = str();
            entries.emplace_back(page_id, std::move(owner));
        }
        return entries;
    }

private:
    bool need(size_t n) {
        if (!ok_ || size_ - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    uint64_t get(int width) {
        if (!need(width)) return 0;
        uint64_t v = 0;
        for (int i = width - 1; i >= 0; i--) {
            v = (v << 8) | data_[pos_ + i];
        }
        pos_ += width;
        return v;
    }

    const uint8_t *data_;
    size_t size_;
    size_t pos_ = 0;
    bool ok_ = true;
};

bool page_bytes_valid(const DsmMessage &msg) {
    if (msg.page_data.size() == DSM_PAGE_SIZE) return true;
    SPDLOG_ERROR("{} for array {} page {} carries {} bytes, expected {}", dsm_msg_type_string(msg.type),
                 msg.array_id, msg.page_id, msg.page_data.size(), DSM_PAGE_SIZE);
    return false;
}

} // namespace

const char *dsm_msg_type_string(uint16_t type) {
    switch (type) {
    case DSM_MSG_NONE:
        return "NONE";
    case DSM_MSG_PAGE_REQUEST:
        return "PAGE_REQUEST";
    case DSM_MSG_PAGE_RESPONSE:
        return "PAGE_RESPONSE";
    case DSM_MSG_PAGE_PUSH:
        return "PAGE_PUSH";
    case DSM_MSG_PAGE_PUSH_ACK:
        return "PAGE_PUSH_ACK";
    case DSM_MSG_LEASE_ACQUIRE:
        return "LEASE_ACQUIRE";
    case DSM_MSG_LEASE_GRANT:
        return "LEASE_GRANT";
    case DSM_MSG_LEASE_RELEASE:
        return "LEASE_RELEASE";
    case DSM_MSG_LEASE_VALIDATE:
        return "LEASE_VALIDATE";
    case DSM_MSG_LEASE_REVOKE:
        return "LEASE_REVOKE";
    case DSM_MSG_LEASE_ACK:
        return "LEASE_ACK";
    case DSM_MSG_LEASE_ABANDON:
        return "LEASE_ABANDON";
    case DSM_MSG_INVALIDATE:
        return "INVALIDATE";
    case DSM_MSG_INVALIDATE_ACK:
        return "INVALIDATE_ACK";
    case DSM_MSG_ARRAY_INFO_REQUEST:
        return "ARRAY_INFO_REQUEST";
    case DSM_MSG_ARRAY_INFO_RESPONSE:
        return "ARRAY_INFO_RESPONSE";
    default:
        return "UNKNOWN";
    }
}

DsmMessage make_reply(const DsmMessage &req, uint16_t reply_type, const NodeID &local_node) {
    DsmMessage resp;
    resp.type = reply_type;
    resp.msg_id = req.msg_id;
    resp.src_node = local_node;
    resp.array_id = req.array_id;
    resp.page_id = req.page_id;
    return resp;
}

std::vector<uint8_t> encode_message(const DsmMessage &msg) {
    std::vector<uint8_t> payload;
    PayloadWriter w(payload);

    w.str(msg.src_node);
    w.str(msg.array_id);

    switch (msg.type) {
    case DSM_MSG_PAGE_REQUEST:
    case DSM_MSG_PAGE_PUSH_ACK:
        w.i32(msg.page_id);
        w.i64(msg.version);
        break;
    case DSM_MSG_PAGE_RESPONSE:
        w.i32(msg.page_id);
        w.i64(msg.version);
        w.bytes(msg.page_data);
        break;
    case DSM_MSG_PAGE_PUSH:
        w.i32(msg.page_id);
        w.i64(msg.version);
        w.str(msg.lease_id);
        w.bytes(msg.page_data);
        break;
    case DSM_MSG_LEASE_ACQUIRE:
        w.i32(msg.page_id);
        w.u8(static_cast<uint8_t>(msg.lease_type));
        w.str(msg.owner);
        w.i64(msg.version);
        w.str(msg.lease_id);
        break;
    case DSM_MSG_LEASE_GRANT:
        w.i32(msg.page_id);
        w.str(msg.lease_id);
        w.u8(static_cast<uint8_t>(msg.lease_type));
        w.str(msg.owner);
        w.i64(msg.version);
        w.u32(msg.ttl_ms);
        w.str(msg.page_owner);
        break;
    case DSM_MSG_LEASE_RELEASE:
    case DSM_MSG_LEASE_VALIDATE:
    case DSM_MSG_LEASE_ABANDON:
        w.str(msg.lease_id);
        w.i32(msg.page_id);
        break;
    case DSM_MSG_LEASE_REVOKE:
        w.i32(msg.page_id);
        break;
    case DSM_MSG_LEASE_ACK:
        w.str(msg.lease_id);
        w.i32(msg.page_id);
        w.u32(msg.ttl_ms);
        break;
    case DSM_MSG_INVALIDATE:
        w.i64(msg.version);
        w.owners(msg.owners);
        break;
    case DSM_MSG_INVALIDATE_ACK:
        w.i64(msg.version);
        break;
    case DSM_MSG_ARRAY_INFO_REQUEST:
        break;
    case DSM_MSG_ARRAY_INFO_RESPONSE:
        w.u64(msg.length);
        w.u8(static_cast<uint8_t>(msg.element_type));
        w.str(msg.home_node);
        w.i64(msg.version);
        w.owners(msg.owners);
        break;
    default:
        SPDLOG_ERROR("Encoding message of unknown type {}", msg.type);
        break;
    }

    std::vector<uint8_t> frame;
    frame.reserve(DSM_MSG_HEADER_SIZE + payload.size());
    PayloadWriter h(frame);
    h.u32(DSM_MSG_MAGIC);
    h.u16(msg.type);
    h.u8(static_cast<uint8_t>(msg.status));
    h.u8(0);
    h.u32(msg.msg_id);
    h.u32(static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

DsmError decode_header(const uint8_t *data, size_t size, dsm_msg_header_t &header) {
    PayloadReader r(data, size);
    header.magic = r.u32();
    header.msg_type = r.u16();
    header.status = r.u8();
    header.reserved = r.u8();
    header.msg_id = r.u32();
    header.payload_size = r.u32();
    if (!r.ok()) {
        SPDLOG_ERROR("Truncated frame header ({} bytes)", size);
        return DsmError::PROTOCOL;
    }
    // Packed fields cannot bind to the logger's references
    const uint32_t magic = header.magic;
    const uint32_t payload_size = header.payload_size;
    const unsigned status = header.status;
    if (magic != DSM_MSG_MAGIC) {
        SPDLOG_ERROR("Bad frame magic 0x{:x}", magic);
        return DsmError::PROTOCOL;
    }
    if (payload_size > DSM_MAX_PAYLOAD) {
        SPDLOG_ERROR("Frame payload of {} bytes exceeds limit {}", payload_size, DSM_MAX_PAYLOAD);
        return DsmError::PROTOCOL;
    }
    if (status > static_cast<uint8_t>(DsmError::INVALID_ARGUMENT)) {
        SPDLOG_ERROR("Unknown status code {} in frame", status);
        return DsmError::PROTOCOL;
    }
    return DsmError::OK;
}

DsmError decode_payload(const dsm_msg_header_t &header, const uint8_t *payload, size_t size, DsmMessage &msg) {
    const uint32_t payload_size = header.payload_size;
    if (size != payload_size) {
        SPDLOG_ERROR("Payload length {} does not match header {}", size, payload_size);
        return DsmError::PROTOCOL;
    }

    msg = DsmMessage();
    msg.type = header.msg_type;
    msg.status = static_cast<DsmError>(header.status);
    msg.msg_id = header.msg_id;

    PayloadReader r(payload, size);
    msg.src_node = r.str();
    msg.array_id = r.str();

    switch (msg.type) {
    case DSM_MSG_PAGE_REQUEST:
    case DSM_MSG_PAGE_PUSH_ACK:
        msg.page_id = r.i32();
        msg.version = r.i64();
        break;
    case DSM_MSG_PAGE_RESPONSE:
        msg.page_id = r.i32();
        msg.version = r.i64();
        msg.page_data = r.bytes();
        break;
    case DSM_MSG_PAGE_PUSH:
        msg.page_id = r.i32();
        msg.version = r.i64();
        msg.lease_id = r.str();
        msg.page_data = r.bytes();
        break;
    case DSM_MSG_LEASE_ACQUIRE:
        msg.page_id = r.i32();
        msg.lease_type = r.u8() == 1 ? LeaseType::WRITE : LeaseType::READ;
        msg.owner = r.str();
        msg.version = r.i64();
        msg.lease_id = r.str();
        break;
    case DSM_MSG_LEASE_GRANT:
        msg.page_id = r.i32();
        msg.lease_id = r.str();
        msg.lease_type = r.u8() == 1 ? LeaseType::WRITE : LeaseType::READ;
        msg.owner = r.str();
        msg.version = r.i64();
        msg.ttl_ms = r.u32();
        msg.page_owner = r.str();
        break;
    case DSM_MSG_LEASE_RELEASE:
    case DSM_MSG_LEASE_VALIDATE:
    case DSM_MSG_LEASE_ABANDON:
        msg.lease_id = r.str();
        msg.page_id = r.i32();
        break;
    case DSM_MSG_LEASE_REVOKE:
        msg.page_id = r.i32();
        break;
    case DSM_MSG_LEASE_ACK:
        msg.lease_id = r.str();
        msg.page_id = r.i32();
        msg.ttl_ms = r.u32();
        break;
    case DSM_MSG_INVALIDATE:
        msg.version = r.i64();
        msg.owners = r.owners();
        break;
    case DSM_MSG_INVALIDATE_ACK:
        msg.version = r.i64();
        break;
    case DSM_MSG_ARRAY_INFO_REQUEST:
        break;
    case DSM_MSG_ARRAY_INFO_RESPONSE: {
        msg.length = r.u64();
        uint8_t type = r.u8();
        if (type > static_cast<uint8_t>(ElementType::FLOAT32)) {
            SPDLOG_ERROR("Unknown element type {} in array info", type);
            return DsmError::PROTOCOL;
        }
        msg.element_type = static_cast<ElementType>(type);
        msg.home_node = r.str();
        msg.version = r.i64();
        msg.owners = r.owners();
        break;
    }
    default:
        SPDLOG_ERROR("Unknown message type {}", msg.type);
        return DsmError::PROTOCOL;
    }

    if (!r.ok() || !r.exhausted()) {
        SPDLOG_ERROR("Malformed {} payload ({} bytes)", dsm_msg_type_string(msg.type), size);
        return DsmError::PROTOCOL;
    }

    // Page bytes must match the cluster-wide page size
    bool carries_page = msg.type == DSM_MSG_PAGE_PUSH ||
                        (msg.type == DSM_MSG_PAGE_RESPONSE && msg.status == DsmError::OK);
    if (carries_page && !page_bytes_valid(msg)) {
        return DsmError::PROTOCOL;
    }
    return DsmError::OK;
}

DsmError decode_message(const std::vector<uint8_t> &frame, DsmMessage &msg) {
    dsm_msg_header_t header;
    DsmError err = decode_header(frame.data(), frame.size(), header);
    if (err != DsmError::OK) {
        return err;
    }
    return decode_payload(header, frame.data() + DSM_MSG_HEADER_SIZE, frame.size() - DSM_MSG_HEADER_SIZE, msg);
}
