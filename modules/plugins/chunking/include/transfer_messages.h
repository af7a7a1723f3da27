#pragma once

#include "digest_registry.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litecdn {

// Published on <object>/@retransmit by a downloader. Answered by whoever holds the
// object (the uploader while it awaits an ack, or a storage node).
struct RetransmitRequest {
    std::string object_id;
    bool manifest = false;           // also resend the manifest
    std::vector<uint32_t> indices;   // chunk indices still missing
};

// Published on <object>/@ack once a download verified the whole object.
struct TransferAck {
    std::string object_id;
    Digest object_digest;
};

namespace transfer_messages {

std::string encode_retransmit(const RetransmitRequest& req);
bool decode_retransmit(std::string_view text, RetransmitRequest& out, std::string* error);

// Splits a large index list into several requests of at most max_indices each.
// The manifest flag rides on the first one.
std::vector<RetransmitRequest> split_request(const RetransmitRequest& req, size_t max_indices);

std::string encode_ack(const TransferAck& ack);
bool decode_ack(std::string_view text, TransferAck& out, std::string* error);

} // namespace transfer_messages

} // namespace litecdn
