#include "broker_wire.h"

namespace litecdn {

const char* frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::PUBLISH: return "PUBLISH";
        case FrameType::SUBSCRIBE: return "SUBSCRIBE";
        case FrameType::UNSUBSCRIBE: return "UNSUBSCRIBE";
        case FrameType::QUERY: return "QUERY";
        case FrameType::SAMPLE: return "SAMPLE";
        case FrameType::REPLY: return "REPLY";
        case FrameType::REPLY_END: return "REPLY_END";
        case FrameType::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

namespace {

void put_u32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

void put_u64(std::string& out, uint64_t v) {
    put_u32(out, static_cast<uint32_t>(v >> 32));
    put_u32(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t get_u64(const uint8_t* p) {
    return (static_cast<uint64_t>(get_u32(p)) << 32) | get_u32(p + 4);
}

bool known_type(uint8_t t) {
    switch (static_cast<FrameType>(t)) {
        case FrameType::PUBLISH:
        case FrameType::SUBSCRIBE:
        case FrameType::UNSUBSCRIBE:
        case FrameType::QUERY:
        case FrameType::SAMPLE:
        case FrameType::REPLY:
        case FrameType::REPLY_END:
        case FrameType::ERROR:
            return true;
    }
    return false;
}

} // namespace

namespace broker_wire {

std::string encode(const WireFrame& frame) {
    const size_t body_len = kBodyOverhead + frame.topic.size() + frame.payload.size();
    std::string out;
    out.reserve(kFrameHeaderSize + body_len);
    out.push_back(static_cast<char>(frame.type));
    put_u32(out, static_cast<uint32_t>(body_len));
    put_u64(out, frame.id);
    put_u32(out, static_cast<uint32_t>(frame.topic.size()));
    out.append(frame.topic);
    put_u32(out, static_cast<uint32_t>(frame.payload.size()));
    out.append(frame.payload);
    return out;
}

DecodeStatus decode(const uint8_t* data, size_t len, size_t max_body, WireFrame& out, size_t& consumed,
                    std::string* error) {
    if (len < kFrameHeaderSize) {
        return DecodeStatus::INCOMPLETE;
    }
    if (!known_type(data[0])) {
        if (error) *error = "unknown frame type " + std::to_string(data[0]);
        return DecodeStatus::MALFORMED;
    }
    const uint32_t body_len = get_u32(data + 1);
    if (body_len < kBodyOverhead || body_len > max_body) {
        if (error) *error = "bad body length " + std::to_string(body_len);
        return DecodeStatus::MALFORMED;
    }
    if (len - kFrameHeaderSize < body_len) {
        return DecodeStatus::INCOMPLETE;
    }

    const uint8_t* body = data + kFrameHeaderSize;
    const uint8_t* end = body + body_len;
    const uint8_t* p = body;

    WireFrame frame;
    frame.type = static_cast<FrameType>(data[0]);
    frame.id = get_u64(p);
    p += 8;

    const uint32_t topic_len = get_u32(p);
    p += 4;
    if (static_cast<size_t>(end - p) < static_cast<size_t>(topic_len) + 4) {
        if (error) *error = "topic length runs past the frame";
        return DecodeStatus::MALFORMED;
    }
    frame.topic.assign(reinterpret_cast<const char*>(p), topic_len);
    p += topic_len;

    const uint32_t payload_len = get_u32(p);
    p += 4;
    if (static_cast<size_t>(end - p) != payload_len) {
        if (error) *error = "payload length does not fill the frame";
        return DecodeStatus::MALFORMED;
    }
    frame.payload.assign(reinterpret_cast<const char*>(p), payload_len);

    out = std::move(frame);
    consumed = kFrameHeaderSize + body_len;
    return DecodeStatus::OK;
}

bool extract(std::vector<uint8_t>& buffer, size_t max_body, std::vector<WireFrame>& out, std::string* error) {
    size_t offset = 0;
    while (offset < buffer.size()) {
        WireFrame frame;
        size_t consumed = 0;
        const DecodeStatus status = decode(buffer.data() + offset, buffer.size() - offset, max_body, frame,
                                           consumed, error);
        if (status == DecodeStatus::INCOMPLETE) {
            break;
        }
        if (status == DecodeStatus::MALFORMED) {
            return false;
        }
        out.push_back(std::move(frame));
        offset += consumed;
    }
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
    return true;
}

} // namespace broker_wire

} // namespace litecdn
