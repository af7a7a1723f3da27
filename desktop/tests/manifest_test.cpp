#include "object_manifest.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace litecdn;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static const std::vector<uint8_t> kHello = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

static bool build_hello(ObjectManifest& m, std::vector<Chunk>& chunks) {
    auto sha = DigestRegistry::defaults()->find("sha256");
    std::string error;
    return manifest::build("hello.bin", kHello, 4, *sha, "hello.bin", m, &error, &chunks);
}

static bool test_build() {
    ObjectManifest m;
    std::vector<Chunk> chunks;
    TEST_ASSERT(build_hello(m, chunks), "build failed");

    TEST_ASSERT(m.total_size == 10, "total_size");
    TEST_ASSERT(m.chunk_size == 4, "chunk_size");
    TEST_ASSERT(m.chunk_count == 3, "chunk_count");
    TEST_ASSERT(m.chunk_digests.size() == 3, "three chunk digests");
    TEST_ASSERT(m.expected_chunk_length(0) == 4 && m.expected_chunk_length(2) == 2, "slot lengths");
    TEST_ASSERT(m.expected_chunk_length(3) == 0, "length beyond the last slot");
    TEST_ASSERT(chunks.size() == 3, "chunks handed back");
    for (uint32_t i = 0; i < 3; ++i) {
        TEST_ASSERT(m.chunk_digests[i] == chunks[i].digest, "manifest digest equals chunk digest");
    }

    auto sha = DigestRegistry::defaults()->find("sha256");
    TEST_ASSERT(m.object_digest == sha->compute(kHello), "object digest");
    TEST_ASSERT(manifest::validate(m, sha.get(), nullptr), "built manifest invalid");

    ObjectManifest empty;
    std::string error;
    TEST_ASSERT(manifest::build("empty", {}, 4, *sha, "", empty, &error), "empty build: " + error);
    TEST_ASSERT(empty.chunk_count == 0 && empty.chunk_digests.empty(), "empty object has no chunks");
    TEST_ASSERT(empty.object_digest == sha->compute(std::vector<uint8_t>{}), "digest of empty input");
    return true;
}

static bool test_compute_chunk_count() {
    TEST_ASSERT(manifest::compute_chunk_count(0, 4) == 0, "0 bytes");
    TEST_ASSERT(manifest::compute_chunk_count(1, 4) == 1, "1 byte");
    TEST_ASSERT(manifest::compute_chunk_count(8, 4) == 2, "exact multiple");
    TEST_ASSERT(manifest::compute_chunk_count(9, 4) == 3, "one over");
    TEST_ASSERT(manifest::compute_chunk_count(10, 0) == 0, "zero chunk size");
    return true;
}

static bool test_encode_decode() {
    ObjectManifest m;
    std::vector<Chunk> chunks;
    TEST_ASSERT(build_hello(m, chunks), "build failed");

    const std::string text = manifest::encode(m);
    auto j = nlohmann::json::parse(text);
    TEST_ASSERT(j["format"] == manifest::kFormatName, "format field");
    TEST_ASSERT(j["chunk_count"] == 3, "chunk_count field");
    TEST_ASSERT(j["chunk_digests"].size() == 3, "digest array");
    TEST_ASSERT(j["object_digest"].get<std::string>() == to_hex(m.object_digest), "hex object digest");

    ObjectManifest back;
    std::string error;
    TEST_ASSERT(manifest::decode(text, back, &error), "decode: " + error);
    TEST_ASSERT(back == m, "decoded manifest differs");
    return true;
}

static bool decode_edited(const ObjectManifest& m, void (*edit)(nlohmann::json&)) {
    auto j = nlohmann::json::parse(manifest::encode(m));
    edit(j);
    ObjectManifest out;
    std::string error;
    return manifest::decode(j.dump(), out, &error);
}

static bool test_decode_rejects() {
    ObjectManifest m;
    std::vector<Chunk> chunks;
    TEST_ASSERT(build_hello(m, chunks), "build failed");

    ObjectManifest out;
    std::string error;
    TEST_ASSERT(!manifest::decode("{not json", out, &error), "bad JSON accepted");
    TEST_ASSERT(!manifest::decode("[1,2,3]", out, &error), "array accepted");

    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["format"] = "other"; }), "wrong format accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["version"] = 2; }), "future version accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j.erase("object_id"); }), "missing object_id accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["chunk_count"] = 4; }), "wrong chunk_count accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["chunk_size"] = 0; }), "zero chunk_size accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["chunk_digests"].erase(0); }),
                "short digest list accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["object_digest"] = "xyz"; }), "non-hex digest accepted");
    TEST_ASSERT(!decode_edited(m, [](nlohmann::json& j) { j["total_size"] = "ten"; }), "string size accepted");

    TEST_ASSERT(decode_edited(m, [](nlohmann::json& j) { j.erase("file_name"); }), "file_name is optional");
    return true;
}

static bool test_check_chunk() {
    ObjectManifest m;
    std::vector<Chunk> chunks;
    TEST_ASSERT(build_hello(m, chunks), "build failed");
    auto sha = DigestRegistry::defaults()->find("sha256");

    for (const auto& c : chunks) {
        TEST_ASSERT(manifest::verify(m, c, *sha), "good chunk rejected");
    }

    Chunk c = chunks[1];
    c.payload[0] ^= 0xFF;
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::DIGEST_MISMATCH, "tampered payload");

    c = chunks[1];
    c.digest = sha->compute(std::vector<uint8_t>{'x'});
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::DIGEST_MISMATCH, "frame digest disagrees");

    c = chunks[1];
    c.object_id = "other.bin";
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::WRONG_OBJECT, "wrong object");

    c = chunks[1];
    c.index = 3;
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::OUT_OF_RANGE, "index out of range");

    c = chunks[2];
    c.payload.push_back(0);
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::LENGTH_MISMATCH, "long tail chunk");

    c = chunks[0];
    c.digest_algorithm = "crc32";
    TEST_ASSERT(manifest::check_chunk(m, c, *sha) == ChunkCheck::ALGORITHM_MISMATCH, "algorithm mismatch");
    return true;
}

static bool test_verify_complete() {
    ObjectManifest m;
    std::vector<Chunk> chunks;
    TEST_ASSERT(build_hello(m, chunks), "build failed");
    auto sha = DigestRegistry::defaults()->find("sha256");

    TEST_ASSERT(manifest::verify_complete(m, kHello, *sha), "original bytes rejected");

    std::vector<uint8_t> changed = kHello;
    changed[9] = 'X';
    TEST_ASSERT(!manifest::verify_complete(m, changed, *sha), "changed bytes accepted");

    std::vector<uint8_t> shorter(kHello.begin(), kHello.end() - 1);
    TEST_ASSERT(!manifest::verify_complete(m, shorter, *sha), "short object accepted");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- ObjectManifest tests ---" << std::endl;

    if (test_build()) std::cout << "PASS: build" << std::endl;
    if (test_compute_chunk_count()) std::cout << "PASS: compute_chunk_count" << std::endl;
    if (test_encode_decode()) std::cout << "PASS: encode/decode" << std::endl;
    if (test_decode_rejects()) std::cout << "PASS: decode rejects malformed manifests" << std::endl;
    if (test_check_chunk()) std::cout << "PASS: check_chunk" << std::endl;
    if (test_verify_complete()) std::cout << "PASS: verify_complete" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
