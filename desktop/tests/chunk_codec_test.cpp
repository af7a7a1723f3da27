#include "chunk_codec.h"
#include "logger.h"

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

static std::vector<uint8_t> pattern_bytes(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    return v;
}

static bool test_split_sizes() {
    auto sha = DigestRegistry::defaults()->find("sha256");
    std::vector<Chunk> chunks;
    std::string error;

    TEST_ASSERT(chunk_codec::split("hello.bin", pattern_bytes(10), 4, *sha, chunks, &error), "split failed: " + error);
    TEST_ASSERT(chunks.size() == 3, "10 bytes / 4 should give 3 chunks");
    TEST_ASSERT(chunks[0].payload.size() == 4 && chunks[1].payload.size() == 4 && chunks[2].payload.size() == 2,
                "chunk lengths 4,4,2");
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        TEST_ASSERT(chunks[i].index == i, "index order");
        TEST_ASSERT(chunks[i].chunk_count == 3, "chunk_count");
        TEST_ASSERT(chunks[i].digest_algorithm == "sha256", "algorithm name");
        TEST_ASSERT(sha->matches(chunks[i].payload, chunks[i].digest), "chunk digest");
    }

    TEST_ASSERT(chunk_codec::split("exact", pattern_bytes(8), 4, *sha, chunks, &error), "exact split");
    TEST_ASSERT(chunks.size() == 2 && chunks[1].payload.size() == 4, "exact multiple has no short tail");

    TEST_ASSERT(chunk_codec::split("empty", std::vector<uint8_t>{}, 4, *sha, chunks, &error), "empty split");
    TEST_ASSERT(chunks.empty(), "empty object has zero chunks");

    TEST_ASSERT(!chunk_codec::split("zero", pattern_bytes(10), 0, *sha, chunks, &error), "chunk size 0 accepted");
    return true;
}

static bool test_frame_round_trip() {
    auto sha = DigestRegistry::defaults()->find("sha256");
    std::vector<Chunk> chunks;
    std::string error;
    TEST_ASSERT(chunk_codec::split("dir/object", pattern_bytes(1000), 300, *sha, chunks, &error), "split");

    for (const auto& c : chunks) {
        std::string frame;
        TEST_ASSERT(chunk_codec::serialize(c, frame, &error), "serialize: " + error);
        TEST_ASSERT(frame.size() == chunk_codec::frame_overhead(c.object_id.size(), 6, 32) + c.payload.size(),
                    "frame size = overhead + payload");
        TEST_ASSERT(frame[0] == 'L' && frame[1] == 'C', "magic");

        Chunk back;
        TEST_ASSERT(chunk_codec::deserialize(frame, back, &error), "deserialize: " + error);
        TEST_ASSERT(back == c, "decoded chunk differs");
    }
    return true;
}

static bool test_malformed_frames() {
    auto sha = DigestRegistry::defaults()->find("sha256");
    std::vector<Chunk> chunks;
    std::string error;
    TEST_ASSERT(chunk_codec::split("obj", pattern_bytes(20), 8, *sha, chunks, &error), "split");

    std::string frame;
    TEST_ASSERT(chunk_codec::serialize(chunks[1], frame, &error), "serialize");
    Chunk out;

    TEST_ASSERT(!chunk_codec::deserialize(std::string_view(frame).substr(0, frame.size() - 1), out, &error),
                "truncated frame accepted");
    TEST_ASSERT(!chunk_codec::deserialize(frame + "x", out, &error), "trailing byte accepted");
    TEST_ASSERT(!chunk_codec::deserialize(std::string_view(frame).substr(0, 5), out, &error), "header-only accepted");
    TEST_ASSERT(!chunk_codec::deserialize("", out, &error), "empty frame accepted");

    std::string bad_magic = frame;
    bad_magic[0] = 'X';
    TEST_ASSERT(!chunk_codec::deserialize(bad_magic, out, &error), "bad magic accepted");

    std::string bad_version = frame;
    bad_version[2] = 9;
    TEST_ASSERT(!chunk_codec::deserialize(bad_version, out, &error), "bad version accepted");

    std::string bad_type = frame;
    bad_type[3] = 0x7F;
    TEST_ASSERT(!chunk_codec::deserialize(bad_type, out, &error), "bad frame type accepted");

    Chunk bad_index = chunks[1];
    bad_index.index = bad_index.chunk_count;
    std::string bad_index_frame;
    if (chunk_codec::serialize(bad_index, bad_index_frame, &error)) {
        TEST_ASSERT(!chunk_codec::deserialize(bad_index_frame, out, &error), "index >= chunk_count accepted");
    }
    return true;
}

static bool test_chunk_size_limit() {
    auto sha = DigestRegistry::defaults()->find("sha256");
    std::string error;
    const size_t overhead = chunk_codec::frame_overhead(3, 6, 32);

    TEST_ASSERT(chunk_codec::validate_chunk_size(1000, "obj", *sha, 1000 + overhead, &error),
                "exact fit rejected: " + error);
    TEST_ASSERT(!chunk_codec::validate_chunk_size(1001, "obj", *sha, 1000 + overhead, &error),
                "oversized chunk accepted");
    TEST_ASSERT(!error.empty(), "no error text for oversized chunk");
    TEST_ASSERT(!chunk_codec::validate_chunk_size(0, "obj", *sha, 1 << 20, &error), "zero chunk size accepted");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- ChunkCodec tests ---" << std::endl;

    if (test_split_sizes()) std::cout << "PASS: split sizes" << std::endl;
    if (test_frame_round_trip()) std::cout << "PASS: frame round trip" << std::endl;
    if (test_malformed_frames()) std::cout << "PASS: malformed frames" << std::endl;
    if (test_chunk_size_limit()) std::cout << "PASS: chunk size limit" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
