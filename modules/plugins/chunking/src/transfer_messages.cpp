#include "transfer_messages.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <limits>

using json = nlohmann::json;

namespace litecdn {
namespace transfer_messages {

namespace {

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

bool parse_object(std::string_view text, json& out, std::string* error) {
    try {
        out = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        set_error(error, std::string("not valid JSON: ") + e.what());
        return false;
    }
    if (!out.is_object()) {
        set_error(error, "expected a JSON object");
        return false;
    }
    return true;
}

} // namespace

std::string encode_retransmit(const RetransmitRequest& req) {
    json j;
    j["type"] = "retransmit";
    j["object_id"] = req.object_id;
    j["manifest"] = req.manifest;
    j["indices"] = req.indices;
    return j.dump();
}

bool decode_retransmit(std::string_view text, RetransmitRequest& out, std::string* error) {
    json j;
    if (!parse_object(text, j, error)) {
        return false;
    }

    RetransmitRequest req;
    try {
        if (j.at("type").get<std::string>() != "retransmit") {
            set_error(error, "not a retransmit request");
            return false;
        }
        req.object_id = j.at("object_id").get<std::string>();
        req.manifest = j.value("manifest", false);
        for (const auto& v : j.value("indices", json::array())) {
            const int64_t idx = v.get<int64_t>();
            if (idx < 0 || idx > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
                set_error(error, "chunk index out of range");
                return false;
            }
            req.indices.push_back(static_cast<uint32_t>(idx));
        }
    } catch (const json::exception& e) {
        set_error(error, std::string("retransmit request field error: ") + e.what());
        return false;
    }

    out = std::move(req);
    return true;
}

std::vector<RetransmitRequest> split_request(const RetransmitRequest& req, size_t max_indices) {
    std::vector<RetransmitRequest> parts;
    if (max_indices == 0 || req.indices.size() <= max_indices) {
        parts.push_back(req);
        return parts;
    }
    for (size_t start = 0; start < req.indices.size(); start += max_indices) {
        RetransmitRequest part;
        part.object_id = req.object_id;
        part.manifest = req.manifest && start == 0;
        const size_t end = std::min(req.indices.size(), start + max_indices);
        part.indices.assign(req.indices.begin() + start, req.indices.begin() + end);
        parts.push_back(std::move(part));
    }
    return parts;
}

std::string encode_ack(const TransferAck& ack) {
    json j;
    j["type"] = "ack";
    j["object_id"] = ack.object_id;
    j["object_digest"] = to_hex(ack.object_digest);
    return j.dump();
}

bool decode_ack(std::string_view text, TransferAck& out, std::string* error) {
    json j;
    if (!parse_object(text, j, error)) {
        return false;
    }

    TransferAck ack;
    try {
        if (j.at("type").get<std::string>() != "ack") {
            set_error(error, "not an ack");
            return false;
        }
        ack.object_id = j.at("object_id").get<std::string>();
        if (!from_hex(j.at("object_digest").get<std::string>(), ack.object_digest)) {
            set_error(error, "ack digest is not hex");
            return false;
        }
    } catch (const json::exception& e) {
        set_error(error, std::string("ack field error: ") + e.what());
        return false;
    }

    out = std::move(ack);
    return true;
}

} // namespace transfer_messages
} // namespace litecdn
