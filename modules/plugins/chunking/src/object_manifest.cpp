#include "object_manifest.h"

#include <nlohmann/json.hpp>

#include <limits>

using json = nlohmann::json;

namespace litecdn {

namespace {

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

} // namespace

uint32_t ObjectManifest::expected_chunk_length(uint32_t index) const {
    if (chunk_count == 0 || index >= chunk_count) {
        return 0;
    }
    if (index + 1 < chunk_count) {
        return chunk_size;
    }
    return static_cast<uint32_t>(total_size - chunk_offset(index));
}

bool ObjectManifest::operator==(const ObjectManifest& other) const {
    return object_id == other.object_id && file_name == other.file_name &&
           total_size == other.total_size && chunk_size == other.chunk_size &&
           chunk_count == other.chunk_count && digest_algorithm == other.digest_algorithm &&
           chunk_digests == other.chunk_digests && object_digest == other.object_digest;
}

const char* chunk_check_to_string(ChunkCheck check) {
    switch (check) {
        case ChunkCheck::OK: return "OK";
        case ChunkCheck::WRONG_OBJECT: return "WRONG_OBJECT";
        case ChunkCheck::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ChunkCheck::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case ChunkCheck::ALGORITHM_MISMATCH: return "ALGORITHM_MISMATCH";
        case ChunkCheck::DIGEST_MISMATCH: return "DIGEST_MISMATCH";
    }
    return "UNKNOWN";
}

namespace manifest {

uint64_t compute_chunk_count(uint64_t total_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

bool build(const std::string& object_id,
           const std::vector<uint8_t>& data,
           uint32_t chunk_size,
           const IntegrityVerifier& verifier,
           const std::string& file_name,
           ObjectManifest& out,
           std::string* error,
           std::vector<Chunk>* chunks_out) {
    std::vector<Chunk> chunks;
    if (!chunk_codec::split(object_id, data, chunk_size, verifier, chunks, error)) {
        return false;
    }

    ObjectManifest m;
    m.object_id = object_id;
    m.file_name = file_name;
    m.total_size = data.size();
    m.chunk_size = chunk_size;
    m.chunk_count = static_cast<uint32_t>(chunks.size());
    m.digest_algorithm = verifier.name();
    m.chunk_digests.reserve(chunks.size());
    for (const auto& c : chunks) {
        m.chunk_digests.push_back(c.digest);
    }
    m.object_digest = verifier.compute(data);
    if (m.object_digest.empty()) {
        set_error(error, "object digest computation failed");
        return false;
    }

    out = std::move(m);
    if (chunks_out) {
        *chunks_out = std::move(chunks);
    }
    return true;
}

bool validate(const ObjectManifest& m, const IntegrityVerifier* verifier, std::string* error) {
    if (m.object_id.empty() || m.object_id.size() > chunk_codec::kMaxObjectIdLength) {
        set_error(error, "object id length out of range");
        return false;
    }
    if (m.chunk_size == 0) {
        set_error(error, "chunk_size must be greater than zero");
        return false;
    }
    if (m.digest_algorithm.empty()) {
        set_error(error, "digest_algorithm missing");
        return false;
    }
    const uint64_t expected = compute_chunk_count(m.total_size, m.chunk_size);
    if (expected != m.chunk_count) {
        set_error(error, "chunk_count " + std::to_string(m.chunk_count) + " does not match ceil(" +
                         std::to_string(m.total_size) + " / " + std::to_string(m.chunk_size) + ") = " +
                         std::to_string(expected));
        return false;
    }
    if (m.chunk_digests.size() != m.chunk_count) {
        set_error(error, "expected " + std::to_string(m.chunk_count) + " chunk digests, got " +
                         std::to_string(m.chunk_digests.size()));
        return false;
    }
    if (verifier) {
        if (verifier->name() != m.digest_algorithm) {
            set_error(error, "verifier " + verifier->name() + " does not match " + m.digest_algorithm);
            return false;
        }
        const size_t size = verifier->digest_size();
        if (m.object_digest.size() != size) {
            set_error(error, "object digest has wrong size");
            return false;
        }
        for (size_t i = 0; i < m.chunk_digests.size(); ++i) {
            if (m.chunk_digests[i].size() != size) {
                set_error(error, "chunk digest " + std::to_string(i) + " has wrong size");
                return false;
            }
        }
    } else if (m.object_digest.empty()) {
        set_error(error, "object digest missing");
        return false;
    }
    return true;
}

ChunkCheck check_chunk(const ObjectManifest& m, const Chunk& chunk, const IntegrityVerifier& verifier) {
    if (chunk.object_id != m.object_id) {
        return ChunkCheck::WRONG_OBJECT;
    }
    if (chunk.index >= m.chunk_count || chunk.chunk_count != m.chunk_count) {
        return ChunkCheck::OUT_OF_RANGE;
    }
    if (chunk.payload.size() != m.expected_chunk_length(chunk.index)) {
        return ChunkCheck::LENGTH_MISMATCH;
    }
    if (chunk.digest_algorithm != m.digest_algorithm || verifier.name() != m.digest_algorithm) {
        return ChunkCheck::ALGORITHM_MISMATCH;
    }
    // The manifest digest is authoritative; the digest carried in the frame must
    // agree with it and with the payload.
    const Digest& expected = m.chunk_digests[chunk.index];
    if (!digests_equal(chunk.digest, expected) || !verifier.matches(chunk.payload, expected)) {
        return ChunkCheck::DIGEST_MISMATCH;
    }
    return ChunkCheck::OK;
}

bool verify(const ObjectManifest& m, const Chunk& chunk, const IntegrityVerifier& verifier) {
    return check_chunk(m, chunk, verifier) == ChunkCheck::OK;
}

bool verify_complete(const ObjectManifest& m, const std::vector<uint8_t>& data, const IntegrityVerifier& verifier) {
    if (data.size() != m.total_size) {
        return false;
    }
    return verifier.matches(data, m.object_digest);
}

std::string encode(const ObjectManifest& m) {
    json digests = json::array();
    for (const auto& d : m.chunk_digests) {
        digests.push_back(to_hex(d));
    }

    json j;
    j["format"] = kFormatName;
    j["version"] = kFormatVersion;
    j["object_id"] = m.object_id;
    j["file_name"] = m.file_name;
    j["total_size"] = m.total_size;
    j["chunk_size"] = m.chunk_size;
    j["chunk_count"] = m.chunk_count;
    j["digest_algorithm"] = m.digest_algorithm;
    j["chunk_digests"] = std::move(digests);
    j["object_digest"] = to_hex(m.object_digest);
    return j.dump();
}

bool decode(std::string_view text, ObjectManifest& out, std::string* error) {
    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        set_error(error, std::string("manifest is not valid JSON: ") + e.what());
        return false;
    }
    if (!j.is_object()) {
        set_error(error, "manifest must be a JSON object");
        return false;
    }

    ObjectManifest m;
    try {
        if (j.at("format").get<std::string>() != kFormatName) {
            set_error(error, "unknown manifest format");
            return false;
        }
        if (j.at("version").get<int>() != kFormatVersion) {
            set_error(error, "unsupported manifest version");
            return false;
        }
        m.object_id = j.at("object_id").get<std::string>();
        m.file_name = j.value("file_name", std::string());
        m.total_size = j.at("total_size").get<uint64_t>();

        const uint64_t chunk_size = j.at("chunk_size").get<uint64_t>();
        const uint64_t chunk_count = j.at("chunk_count").get<uint64_t>();
        if (chunk_size > std::numeric_limits<uint32_t>::max() || chunk_count > std::numeric_limits<uint32_t>::max()) {
            set_error(error, "chunk_size or chunk_count out of range");
            return false;
        }
        m.chunk_size = static_cast<uint32_t>(chunk_size);
        m.chunk_count = static_cast<uint32_t>(chunk_count);
        m.digest_algorithm = j.at("digest_algorithm").get<std::string>();

        const json& digests = j.at("chunk_digests");
        if (!digests.is_array()) {
            set_error(error, "chunk_digests must be an array");
            return false;
        }
        m.chunk_digests.reserve(digests.size());
        for (const auto& d : digests) {
            Digest bin;
            if (!from_hex(d.get<std::string>(), bin)) {
                set_error(error, "chunk digest is not hex");
                return false;
            }
            m.chunk_digests.push_back(std::move(bin));
        }
        if (!from_hex(j.at("object_digest").get<std::string>(), m.object_digest)) {
            set_error(error, "object digest is not hex");
            return false;
        }
    } catch (const json::exception& e) {
        set_error(error, std::string("manifest field error: ") + e.what());
        return false;
    }

    if (!validate(m, nullptr, error)) {
        return false;
    }
    out = std::move(m);
    return true;
}

} // namespace manifest
} // namespace litecdn
