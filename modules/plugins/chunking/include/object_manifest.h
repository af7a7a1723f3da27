#ifndef LITECDN_OBJECT_MANIFEST_H
#define LITECDN_OBJECT_MANIFEST_H

#include "chunk_codec.h"
#include "digest_registry.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litecdn {

/**
 * Object metadata, published before any chunk and immutable afterwards.
 *
 * chunk_count == ceil(total_size / chunk_size) and chunk_digests has exactly
 * chunk_count entries. A zero-length object has no chunks.
 */
struct ObjectManifest {
    std::string object_id;
    std::string file_name;          // informational, may be empty
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    uint32_t chunk_count = 0;
    std::string digest_algorithm;
    std::vector<Digest> chunk_digests;
    Digest object_digest;

    uint64_t chunk_offset(uint32_t index) const {
        return static_cast<uint64_t>(index) * chunk_size;
    }

    // Exact payload length of chunk `index` (index must be < chunk_count).
    uint32_t expected_chunk_length(uint32_t index) const;

    bool operator==(const ObjectManifest& other) const;
    bool operator!=(const ObjectManifest& other) const { return !(*this == other); }
};

enum class ChunkCheck {
    OK,
    WRONG_OBJECT,        // object_id differs from the manifest
    OUT_OF_RANGE,        // index or chunk_count disagree with the manifest
    LENGTH_MISMATCH,     // payload length differs from the slot length
    ALGORITHM_MISMATCH,  // chunk digested with a different algorithm
    DIGEST_MISMATCH,     // payload does not hash to the manifest digest
};

const char* chunk_check_to_string(ChunkCheck check);

namespace manifest {

inline constexpr const char* kFormatName = "litecdn-manifest";
inline constexpr int kFormatVersion = 1;

uint64_t compute_chunk_count(uint64_t total_size, uint32_t chunk_size);

// Splits data, digests every chunk and the whole object. chunks_out, when given,
// receives the chunks so the caller does not hash twice.
bool build(const std::string& object_id,
           const std::vector<uint8_t>& data,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           const std::string& file_name,
           ObjectManifest& out,
           std::string* error,
           std::vector<Chunk>* chunks_out = nullptr);

// Structural invariants. With a verifier, digest sizes are checked too.
bool validate(const ObjectManifest& m, const IntegrityVerifier* verifier, std::string* error);

ChunkCheck check_chunk(const ObjectManifest& m, const Chunk& chunk, const IntegrityVerifier& verifier);

bool verify(const ObjectManifest& m, const Chunk& chunk, const IntegrityVerifier& verifier);

// Final gate: exact length and whole-object digest.
bool verify_complete(const ObjectManifest& m, const std::vector<uint8_t>& data, const IntegrityVerifier& verifier);

std::string encode(const ObjectManifest& m);
bool decode(std::string_view text, ObjectManifest& out, std::string* error);

} // namespace manifest

} // namespace litecdn

#endif // LITECDN_OBJECT_MANIFEST_H
