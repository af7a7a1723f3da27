#include "chunk_codec.h"

#include <algorithm>

#include <limits>

namespace litecdn {
namespace chunk_codec {

namespace {

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

void append_uint16_le(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void append_uint32_le(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

uint16_t read_uint16_le(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (static_cast<uint16_t>(data[1]) << 8));
}

uint32_t read_uint32_le(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

} // namespace

size_t frame_overhead(size_t object_id_length, size_t algorithm_length, size_t digest_size) {
    return kFixedHeaderSize + object_id_length + algorithm_length + digest_size;
}

bool validate_chunk_size(uint32_t chunk_size,
                         const std::string& object_id,
                         const IntegrityVerifier& verifier,
                         size_t max_message_size,
                         std::string* error) {
    if (chunk_size == 0) {
        set_error(error, "chunk size must be greater than zero");
        return false;
    }
    const size_t overhead = frame_overhead(object_id.size(), verifier.name().size(), verifier.digest_size());
    if (static_cast<uint64_t>(chunk_size) + overhead > max_message_size) {
        set_error(error, "chunk size " + std::to_string(chunk_size) + " plus " + std::to_string(overhead) +
                         " header bytes exceeds the transport limit of " + std::to_string(max_message_size));
        return false;
    }
    return true;
}

bool split(const std::string& object_id,
           const uint8_t* data, size_t size,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           std::vector<Chunk>& out,
           std::string* error) {
    out.clear();
    if (chunk_size == 0) {
        set_error(error, "chunk size must be greater than zero");
        return false;
    }

    const uint64_t count = (static_cast<uint64_t>(size) + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        set_error(error, "object needs more than 2^32-1 chunks at chunk size " + std::to_string(chunk_size));
        return false;
    }

    out.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        const size_t offset = static_cast<size_t>(i * chunk_size);
        const size_t len = std::min<size_t>(chunk_size, size - offset);

        Chunk chunk;
        chunk.object_id = object_id;
        chunk.index = static_cast<uint32_t>(i);
        chunk.chunk_count = static_cast<uint32_t>(count);
        chunk.digest_algorithm = verifier.name();
        chunk.payload.assign(data + offset, data + offset + len);
        chunk.digest = verifier.compute(chunk.payload);
        if (chunk.digest.empty()) {
            set_error(error, "digest computation failed for chunk " + std::to_string(i));
            out.clear();
            return false;
        }
        out.push_back(std::move(chunk));
    }
    return true;
}

bool split(const std::string& object_id,
           const std::vector<uint8_t>& data,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           std::vector<Chunk>& out,
           std::string* error) {
    return split(object_id, data.data(), data.size(), chunk_size, verifier, out, error);
}

bool serialize(const Chunk& chunk, std::string& out, std::string* error) {
    if (chunk.object_id.empty() || chunk.object_id.size() > kMaxObjectIdLength) {
        set_error(error, "object id length out of range");
        return false;
    }
    if (chunk.digest_algorithm.empty() || chunk.digest_algorithm.size() > kMaxAlgorithmLength) {
        set_error(error, "digest algorithm name length out of range");
        return false;
    }
    if (chunk.digest.empty() || chunk.digest.size() > kMaxDigestLength) {
        set_error(error, "digest length out of range");
        return false;
    }
    if (chunk.index >= chunk.chunk_count) {
        set_error(error, "chunk index " + std::to_string(chunk.index) + " not below chunk count " +
                         std::to_string(chunk.chunk_count));
        return false;
    }
    if (chunk.payload.size() > std::numeric_limits<uint32_t>::max()) {
        set_error(error, "payload too large");
        return false;
    }

    out.clear();
    out.reserve(frame_overhead(chunk.object_id.size(), chunk.digest_algorithm.size(), chunk.digest.size()) +
                chunk.payload.size());
    out.push_back(static_cast<char>(kMagic0));
    out.push_back(static_cast<char>(kMagic1));
    out.push_back(static_cast<char>(kVersion));
    out.push_back(static_cast<char>(kFrameTypeChunk));
    append_uint16_le(out, static_cast<uint16_t>(chunk.object_id.size()));
    out.append(chunk.object_id);
    append_uint32_le(out, chunk.index);
    append_uint32_le(out, chunk.chunk_count);
    append_uint32_le(out, static_cast<uint32_t>(chunk.payload.size()));
    out.push_back(static_cast<char>(chunk.digest_algorithm.size()));
    out.append(chunk.digest_algorithm);
    out.push_back(static_cast<char>(chunk.digest.size()));
    out.append(reinterpret_cast<const char*>(chunk.digest.data()), chunk.digest.size());
    out.append(reinterpret_cast<const char*>(chunk.payload.data()), chunk.payload.size());
    return true;
}

bool deserialize(std::string_view frame, Chunk& out, std::string* error) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(frame.data());
    const size_t len = frame.size();

    if (len < kFixedHeaderSize) {
        set_error(error, "frame shorter than header (" + std::to_string(len) + " bytes)");
        return false;
    }
    if (data[0] != kMagic0 || data[1] != kMagic1) {
        set_error(error, "bad magic");
        return false;
    }
    if (data[2] != kVersion) {
        set_error(error, "unsupported frame version " + std::to_string(data[2]));
        return false;
    }
    if (data[3] != kFrameTypeChunk) {
        set_error(error, "unexpected frame type " + std::to_string(data[3]));
        return false;
    }

    size_t offset = 4;
    const uint16_t id_len = read_uint16_le(data + offset); offset += 2;
    if (id_len == 0 || id_len > kMaxObjectIdLength) {
        set_error(error, "object id length " + std::to_string(id_len) + " out of range");
        return false;
    }
    // id + index + count + payload_len + alg_len must fit
    if (offset + id_len + 13 > len) {
        set_error(error, "truncated frame (object id)");
        return false;
    }
    Chunk chunk;
    chunk.object_id.assign(reinterpret_cast<const char*>(data + offset), id_len);
    offset += id_len;

    chunk.index = read_uint32_le(data + offset); offset += 4;
    chunk.chunk_count = read_uint32_le(data + offset); offset += 4;
    const uint32_t payload_len = read_uint32_le(data + offset); offset += 4;
    if (chunk.index >= chunk.chunk_count) {
        set_error(error, "chunk index " + std::to_string(chunk.index) + " not below chunk count " +
                         std::to_string(chunk.chunk_count));
        return false;
    }

    const uint8_t alg_len = data[offset++];
    if (alg_len == 0 || alg_len > kMaxAlgorithmLength) {
        set_error(error, "algorithm name length out of range");
        return false;
    }
    if (offset + alg_len + 1 > len) {
        set_error(error, "truncated frame (algorithm)");
        return false;
    }
    chunk.digest_algorithm.assign(reinterpret_cast<const char*>(data + offset), alg_len);
    offset += alg_len;

    const uint8_t digest_len = data[offset++];
    if (digest_len == 0 || digest_len > kMaxDigestLength) {
        set_error(error, "digest length out of range");
        return false;
    }
    if (offset + digest_len > len) {
        set_error(error, "truncated frame (digest)");
        return false;
    }
    chunk.digest.assign(data + offset, data + offset + digest_len);
    offset += digest_len;

    const size_t remaining = len - offset;
    if (remaining != payload_len) {
        set_error(error, "declared payload length " + std::to_string(payload_len) + " but " +
                         std::to_string(remaining) + " bytes follow");
        return false;
    }
    chunk.payload.assign(data + offset, data + len);

    out = std::move(chunk);
    return true;
}

} // namespace chunk_codec
} // namespace litecdn
