#ifndef LITECDN_TOPIC_SCHEME_H
#define LITECDN_TOPIC_SCHEME_H

#include <cstdint>
#include <string>

namespace litecdn {

inline constexpr const char* kDefaultResourceRoot = "/litecdn";

enum class TopicRole {
    MANIFEST,
    CHUNK,
    RETRANSMIT,
    ACK,
};

struct ParsedTopic {
    std::string object_id;
    TopicRole role = TopicRole::MANIFEST;
    uint32_t chunk_index = 0;   // CHUNK only
};

/**
 * Maps (object_id, role) onto topics under a resource root:
 *
 *   <root>/files/<object_id>/@manifest
 *   <root>/files/<object_id>/@chunk/<index>
 *   <root>/files/<object_id>/@retransmit
 *   <root>/files/<object_id>/@ack
 *
 * Object id segments may not start with '@', so the first '@' segment after
 * "files" always names the role and parse() is the exact inverse.
 */
class TopicScheme {
public:
    explicit TopicScheme(std::string resource_root = kDefaultResourceRoot);

    // Non-empty '/'-separated segments, no '*', no whitespace or control bytes,
    // no segment starting with '@', at most 1024 bytes.
    static bool validate_object_id(const std::string& object_id, std::string* error);

    // Absolute path without trailing '/', same segment rules as object ids.
    static bool validate_root(const std::string& root, std::string* error);

    const std::string& root() const { return m_root; }

    std::string manifest_topic(const std::string& object_id) const;
    std::string chunk_topic(const std::string& object_id, uint32_t index) const;
    std::string chunk_pattern(const std::string& object_id) const;
    std::string retransmit_topic(const std::string& object_id) const;
    std::string ack_topic(const std::string& object_id) const;

    // Every manifest under the root.
    std::string all_manifests_pattern() const;

    bool parse(const std::string& topic, ParsedTopic& out) const;

private:
    std::string object_prefix(const std::string& object_id) const;

    std::string m_root;
};

} // namespace litecdn

#endif // LITECDN_TOPIC_SCHEME_H
