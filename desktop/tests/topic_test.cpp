#include "logger.h"
#include "topic_matcher.h"
#include "topic_scheme.h"
#include "transfer_messages.h"

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

static bool test_topic_names() {
    TopicScheme topics("/cdn");
    TEST_ASSERT(topics.root() == "/cdn", "root");
    TEST_ASSERT(topics.manifest_topic("movies/a.mp4") == "/cdn/files/movies/a.mp4/@manifest", "manifest topic");
    TEST_ASSERT(topics.chunk_topic("movies/a.mp4", 12) == "/cdn/files/movies/a.mp4/@chunk/12", "chunk topic");
    TEST_ASSERT(topics.chunk_pattern("a") == "/cdn/files/a/@chunk/*", "chunk pattern");
    TEST_ASSERT(topics.retransmit_topic("a") == "/cdn/files/a/@retransmit", "retransmit topic");
    TEST_ASSERT(topics.ack_topic("a") == "/cdn/files/a/@ack", "ack topic");
    TEST_ASSERT(topics.all_manifests_pattern() == "/cdn/files/**/@manifest", "all manifests");

    TopicScheme fallback("no-leading-slash");
    TEST_ASSERT(fallback.root() == kDefaultResourceRoot, "invalid root falls back");
    return true;
}

static bool test_parse() {
    TopicScheme topics;
    ParsedTopic p;

    TEST_ASSERT(topics.parse(topics.manifest_topic("x/y.bin"), p), "parse manifest");
    TEST_ASSERT(p.object_id == "x/y.bin" && p.role == TopicRole::MANIFEST, "manifest fields");

    TEST_ASSERT(topics.parse(topics.chunk_topic("x/y.bin", 4294967295u), p), "parse max index");
    TEST_ASSERT(p.role == TopicRole::CHUNK && p.chunk_index == 4294967295u, "chunk fields");

    TEST_ASSERT(topics.parse(topics.retransmit_topic("o"), p) && p.role == TopicRole::RETRANSMIT, "retransmit");
    TEST_ASSERT(topics.parse(topics.ack_topic("o"), p) && p.role == TopicRole::ACK, "ack");

    TEST_ASSERT(!topics.parse("/other/files/o/@manifest", p), "foreign root");
    TEST_ASSERT(!topics.parse("/litecdn/files/o/@chunk/007", p), "non-canonical index");
    TEST_ASSERT(!topics.parse("/litecdn/files/o/@chunk/4294967296", p), "index overflow");
    TEST_ASSERT(!topics.parse("/litecdn/files/o/@chunk/", p), "missing index");
    TEST_ASSERT(!topics.parse("/litecdn/files/o/@unknown", p), "unknown role");
    TEST_ASSERT(!topics.parse("/litecdn/files/@manifest", p), "missing object id");
    return true;
}

static bool test_object_id_validation() {
    std::string error;
    TEST_ASSERT(TopicScheme::validate_object_id("a", &error), "single segment");
    TEST_ASSERT(TopicScheme::validate_object_id("dir/sub/file.bin", &error), "nested path");
    TEST_ASSERT(!TopicScheme::validate_object_id("", &error), "empty id");
    TEST_ASSERT(!TopicScheme::validate_object_id("/abs", &error), "leading slash");
    TEST_ASSERT(!TopicScheme::validate_object_id("a//b", &error), "empty segment");
    TEST_ASSERT(!TopicScheme::validate_object_id("a/", &error), "trailing slash");
    TEST_ASSERT(!TopicScheme::validate_object_id("a/*", &error), "wildcard");
    TEST_ASSERT(!TopicScheme::validate_object_id("a b", &error), "whitespace");
    TEST_ASSERT(!TopicScheme::validate_object_id("a/@chunk", &error), "role-like segment");
    TEST_ASSERT(!TopicScheme::validate_object_id(std::string(1025, 'a'), &error), "too long");
    return true;
}

static bool test_matcher() {
    TEST_ASSERT(topic_matches("/a/b/c", "/a/b/c"), "literal");
    TEST_ASSERT(!topic_matches("/a/b/c", "/a/b"), "literal prefix");
    TEST_ASSERT(topic_matches("/a/*/c", "/a/b/c"), "single wildcard");
    TEST_ASSERT(!topic_matches("/a/*/c", "/a/b/x/c"), "* spans one segment only");
    TEST_ASSERT(topic_matches("/a/**/c", "/a/c"), "** matches zero segments");
    TEST_ASSERT(topic_matches("/a/**/c", "/a/b/x/c"), "** matches many");
    TEST_ASSERT(topic_matches("/a/**", "/a/b/c"), "trailing **");

    TopicScheme topics;
    TEST_ASSERT(topic_matches(topics.chunk_pattern("o"), topics.chunk_topic("o", 3)), "chunk pattern matches");
    TEST_ASSERT(!topic_matches(topics.chunk_pattern("o"), topics.chunk_topic("o2", 3)), "other object");
    TEST_ASSERT(!topic_matches(topics.chunk_pattern("o"), topics.manifest_topic("o")), "manifest is not a chunk");
    TEST_ASSERT(topic_matches(topics.all_manifests_pattern(), topics.manifest_topic("d/e/f")), "all manifests");
    TEST_ASSERT(!topic_matches(topics.all_manifests_pattern(), topics.chunk_topic("d", 0)), "not a manifest");

    TEST_ASSERT(is_pattern("/a/*"), "is_pattern");
    TEST_ASSERT(!is_pattern("/a/b"), "is_pattern literal");
    return true;
}

static bool test_control_messages() {
    RetransmitRequest req;
    req.object_id = "dir/x.bin";
    req.manifest = true;
    req.indices = {1, 5, 9};

    RetransmitRequest back;
    std::string error;
    TEST_ASSERT(transfer_messages::decode_retransmit(transfer_messages::encode_retransmit(req), back, &error),
                "decode_retransmit: " + error);
    TEST_ASSERT(back.object_id == req.object_id && back.manifest && back.indices == req.indices, "request fields");
    TEST_ASSERT(!transfer_messages::decode_retransmit("garbage", back, &error), "garbage request accepted");

    RetransmitRequest big;
    big.object_id = "big";
    big.manifest = true;
    for (uint32_t i = 0; i < 10; ++i) big.indices.push_back(i);
    const auto parts = transfer_messages::split_request(big, 4);
    TEST_ASSERT(parts.size() == 3, "10 indices in batches of 4");
    TEST_ASSERT(parts[0].manifest && !parts[1].manifest && !parts[2].manifest, "manifest flag on first part");
    TEST_ASSERT(parts[2].indices == std::vector<uint32_t>({8, 9}), "last batch");

    RetransmitRequest manifest_only;
    manifest_only.object_id = "m";
    manifest_only.manifest = true;
    TEST_ASSERT(transfer_messages::split_request(manifest_only, 4).size() == 1, "manifest-only request kept");

    TransferAck ack;
    ack.object_id = "dir/x.bin";
    ack.object_digest = {0xde, 0xad, 0xbe, 0xef};
    TransferAck ack_back;
    TEST_ASSERT(transfer_messages::decode_ack(transfer_messages::encode_ack(ack), ack_back, &error),
                "decode_ack: " + error);
    TEST_ASSERT(ack_back.object_id == ack.object_id && ack_back.object_digest == ack.object_digest, "ack fields");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Topic tests ---" << std::endl;

    if (test_topic_names()) std::cout << "PASS: topic names" << std::endl;
    if (test_parse()) std::cout << "PASS: parse" << std::endl;
    if (test_object_id_validation()) std::cout << "PASS: object id validation" << std::endl;
    if (test_matcher()) std::cout << "PASS: matcher" << std::endl;
    if (test_control_messages()) std::cout << "PASS: control messages" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
