#ifndef LITECDN_BROKER_WIRE_H
#define LITECDN_BROKER_WIRE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace litecdn {

/**
 * Broker TCP framing:
 *
 *   [type u8][body length u32 BE][body]
 *   body = [id u64 BE][topic length u32 BE][topic][payload length u32 BE][payload]
 *
 * Every frame type uses the same body; fields a type does not need are empty.
 *
 *   PUBLISH      topic, payload
 *   SUBSCRIBE    id = client subscription id, topic = pattern
 *   UNSUBSCRIBE  id
 *   QUERY        id = query id, topic = selector
 *   SAMPLE       id = subscription id, topic, payload
 *   REPLY        id = query id, topic, payload
 *   REPLY_END    id = query id
 *   ERROR        payload = message
 */
enum class FrameType : uint8_t {
    PUBLISH = 0x01,
    SUBSCRIBE = 0x02,
    UNSUBSCRIBE = 0x03,
    QUERY = 0x04,
    SAMPLE = 0x10,
    REPLY = 0x11,
    REPLY_END = 0x12,
    ERROR = 0x1F,
};

const char* frame_type_to_string(FrameType type);

struct WireFrame {
    FrameType type = FrameType::PUBLISH;
    uint64_t id = 0;
    std::string topic;
    std::string payload;
};

enum class DecodeStatus {
    OK,
    INCOMPLETE,   // need more bytes
    MALFORMED,    // stream is unusable
};

namespace broker_wire {

constexpr size_t kFrameHeaderSize = 5;
constexpr size_t kBodyOverhead = 16;   // id + two length fields

std::string encode(const WireFrame& frame);

// Decodes one frame from the front of data. consumed is set on OK only. Frames with a
// body larger than max_body are MALFORMED.
DecodeStatus decode(const uint8_t* data, size_t len, size_t max_body, WireFrame& out, size_t& consumed,
                    std::string* error);

// Pulls every complete frame out of buffer, leaving a partial tail. Returns false
// on a malformed stream.
bool extract(std::vector<uint8_t>& buffer, size_t max_body, std::vector<WireFrame>& out, std::string* error);

} // namespace broker_wire

} // namespace litecdn

#endif // LITECDN_BROKER_WIRE_H
