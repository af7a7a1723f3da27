#ifndef LITECDN_CHUNK_CODEC_H
#define LITECDN_CHUNK_CODEC_H

#include "digest_registry.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litecdn {

/**
 * One bounded fragment of an object.
 *
 * The payload starts at byte offset index * chunk_size of the object. Only the last
 * chunk may be shorter than chunk_size.
 */
struct Chunk {
    std::string object_id;
    uint32_t index = 0;
    uint32_t chunk_count = 0;
    std::string digest_algorithm;
    Digest digest;
    std::vector<uint8_t> payload;

    bool operator==(const Chunk& other) const {
        return index == other.index && chunk_count == other.chunk_count &&
               object_id == other.object_id && digest_algorithm == other.digest_algorithm &&
               digest == other.digest && payload == other.payload;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }
};

namespace chunk_codec {

// Frame layout, little-endian:
// ['L']['C'][version:1][type:1][id_len:2][object_id][index:4][chunk_count:4]
// [payload_len:4][alg_len:1][algorithm][digest_len:1][digest][payload]
inline constexpr uint8_t kMagic0 = 'L';
inline constexpr uint8_t kMagic1 = 'C';
inline constexpr uint8_t kVersion = 1;
inline constexpr uint8_t kFrameTypeChunk = 0x01;
inline constexpr size_t kFixedHeaderSize = 2 + 1 + 1 + 2 + 4 + 4 + 4 + 1 + 1;
inline constexpr size_t kMaxObjectIdLength = 1024;
inline constexpr size_t kMaxAlgorithmLength = 32;
inline constexpr size_t kMaxDigestLength = 64;

// Bytes a frame adds on top of its payload.
size_t frame_overhead(size_t object_id_length, size_t algorithm_length, size_t digest_size);

// Checks that a full chunk_size frame for this object fits max_message_size.
bool validate_chunk_size(uint32_t chunk_size,
                         const std::string& object_id,
                         const IntegrityVerifier& verifier,
                         size_t max_message_size,
                         std::string* error);

// Deterministic split into ceil(size / chunk_size) chunks, each carrying its digest.
// Empty input produces zero chunks. Fails on chunk_size == 0 or more than 2^32-1 chunks.
bool split(const std::string& object_id,
           const uint8_t* data, size_t size,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           std::vector<Chunk>& out,
           std::string* error);

bool split(const std::string& object_id,
           const std::vector<uint8_t>& data,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           std::vector<Chunk>& out,
           std::string* error);

bool serialize(const Chunk& chunk, std::string& out, std::string* error);

// Fails (FormatError) on truncation, trailing bytes, bad magic/version/type,
// out-of-bounds length fields and index >= chunk_count. Does not check the digest.
bool deserialize(std::string_view frame, Chunk& out, std::string* error);

} // namespace chunk_codec

} // namespace litecdn

#endif // LITECDN_CHUNK_CODEC_H
