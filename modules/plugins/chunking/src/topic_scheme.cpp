#include "topic_scheme.h"
#include "chunk_codec.h"
#include "logger.h"

#include <cctype>
#include <limits>

namespace litecdn {

namespace {

const char* kFilesSegment = "/files/";

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

bool validate_segments(const std::string& path, size_t start, std::string* error) {
    size_t seg_start = start;
    for (size_t i = start; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/') {
            if (i == seg_start) {
                set_error(error, "empty path segment in '" + path + "'");
                return false;
            }
            if (path[seg_start] == '@') {
                set_error(error, "segment may not start with '@' in '" + path + "'");
                return false;
            }
            seg_start = i + 1;
            continue;
        }
        const unsigned char c = static_cast<unsigned char>(path[i]);
        if (c == '*' || std::isspace(c) || std::iscntrl(c)) {
            set_error(error, "illegal character in '" + path + "'");
            return false;
        }
    }
    return true;
}

bool parse_index(const std::string& text, uint32_t& out) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    // reject non-canonical forms such as "007"
    if (text.size() > 1 && text[0] == '0') {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

} // namespace

TopicScheme::TopicScheme(std::string resource_root) : m_root(std::move(resource_root)) {
    std::string error;
    if (!validate_root(m_root, &error)) {
        LOG_WARN("TOPICS: Invalid resource root (" + error + "), using " + kDefaultResourceRoot);
        m_root = kDefaultResourceRoot;
    }
}

bool TopicScheme::validate_object_id(const std::string& object_id, std::string* error) {
    if (object_id.empty()) {
        set_error(error, "object id is empty");
        return false;
    }
    if (object_id.size() > chunk_codec::kMaxObjectIdLength) {
        set_error(error, "object id longer than " + std::to_string(chunk_codec::kMaxObjectIdLength) + " bytes");
        return false;
    }
    return validate_segments(object_id, 0, error);
}

bool TopicScheme::validate_root(const std::string& root, std::string* error) {
    if (root.size() < 2 || root[0] != '/') {
        set_error(error, "resource root must be an absolute path such as /litecdn");
        return false;
    }
    return validate_segments(root, 1, error);
}

std::string TopicScheme::object_prefix(const std::string& object_id) const {
    return m_root + kFilesSegment + object_id;
}

std::string TopicScheme::manifest_topic(const std::string& object_id) const {
    return object_prefix(object_id) + "/@manifest";
}

std::string TopicScheme::chunk_topic(const std::string& object_id, uint32_t index) const {
    return object_prefix(object_id) + "/@chunk/" + std::to_string(index);
}

std::string TopicScheme::chunk_pattern(const std::string& object_id) const {
    return object_prefix(object_id) + "/@chunk/*";
}

std::string TopicScheme::retransmit_topic(const std::string& object_id) const {
    return object_prefix(object_id) + "/@retransmit";
}

std::string TopicScheme::ack_topic(const std::string& object_id) const {
    return object_prefix(object_id) + "/@ack";
}

std::string TopicScheme::all_manifests_pattern() const {
    return m_root + kFilesSegment + "**/@manifest";
}

bool TopicScheme::parse(const std::string& topic, ParsedTopic& out) const {
    const std::string prefix = m_root + kFilesSegment;
    if (topic.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    const size_t role_pos = topic.find("/@", prefix.size());
    if (role_pos == std::string::npos || role_pos == prefix.size()) {
        return false;
    }

    ParsedTopic parsed;
    parsed.object_id = topic.substr(prefix.size(), role_pos - prefix.size());
    if (!validate_object_id(parsed.object_id, nullptr)) {
        return false;
    }

    const std::string role = topic.substr(role_pos + 2);
    if (role == "manifest") {
        parsed.role = TopicRole::MANIFEST;
    } else if (role == "retransmit") {
        parsed.role = TopicRole::RETRANSMIT;
    } else if (role == "ack") {
        parsed.role = TopicRole::ACK;
    } else if (role.compare(0, 6, "chunk/") == 0) {
        parsed.role = TopicRole::CHUNK;
        if (!parse_index(role.substr(6), parsed.chunk_index)) {
            return false;
        }
    } else {
        return false;
    }

    out = std::move(parsed);
    return true;
}

} // namespace litecdn
