#include "chunk_store.h"
#include "logger.h"
#include "object_manifest.h"
#include "topic_matcher.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace litecdn {

namespace {

constexpr const char* kMetadataFile = "metadata";

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool parse_chunk_file_name(const std::string& name, uint32_t& out) {
    if (name.empty() || name.size() > 10 || (name.size() > 1 && name[0] == '0')) {
        return false;
    }
    uint64_t value = 0;
    for (char c : name) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > 0xFFFFFFFFull) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

} // namespace

ChunkStore::ChunkStore(TopicScheme topics, std::string directory)
    : m_topics(std::move(topics)),
      m_directory(std::move(directory)),
      m_path_hash(DigestRegistry::defaults()->find("sha256")) {}

std::string ChunkStore::object_dir(const std::string& object_id) const {
    const Digest d = m_path_hash->compute(reinterpret_cast<const uint8_t*>(object_id.data()), object_id.size());
    return (fs::path(m_directory) / to_hex(d)).string();
}

bool ChunkStore::write_file(const std::string& path, const std::string& payload, std::string* error) const {
    // written beside the target, then renamed into place
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (error) *error = "cannot open " + tmp;
            return false;
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        if (!out) {
            if (error) *error = "write to " + tmp + " failed";
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        if (error) *error = "rename to " + path + " failed: " + ec.message();
        return false;
    }
    return true;
}

// ============================================================================
// LOAD
// ============================================================================

bool ChunkStore::load(std::string* error) {
    if (m_directory.empty()) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        if (error) *error = "cannot create store directory " + m_directory + ": " + ec.message();
        return false;
    }

    size_t loaded = 0;
    for (fs::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && load_object_dir(it->path().string())) {
            loaded++;
        }
    }
    if (ec) {
        if (error) *error = "cannot scan " + m_directory + ": " + ec.message();
        return false;
    }

    LOG_INFO("STORE: Loaded " + std::to_string(loaded) + " object(s) from " + m_directory);
    return true;
}

bool ChunkStore::load_object_dir(const std::string& path) {
    std::string manifest_payload;
    if (!read_file(fs::path(path) / kMetadataFile, manifest_payload)) {
        LOG_WARN("STORE: Skipping " + path + ": no metadata");
        return false;
    }

    ObjectManifest m;
    std::string error;
    if (!manifest::decode(manifest_payload, m, &error)) {
        LOG_WARN("STORE: Skipping " + path + ": unreadable metadata: " + error);
        return false;
    }
    if (fs::path(object_dir(m.object_id)).filename() != fs::path(path).filename()) {
        LOG_WARN("STORE: Skipping " + path + ": directory does not match object '" + m.object_id + "'");
        return false;
    }

    StoredObject obj;
    obj.manifest = std::move(manifest_payload);

    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        uint32_t index = 0;
        if (!it->is_regular_file(ec) || !parse_chunk_file_name(it->path().filename().string(), index)) {
            continue;
        }
        std::string payload;
        if (!read_file(it->path(), payload)) {
            LOG_WARN("STORE: Cannot read " + it->path().string());
            continue;
        }
        obj.chunks[index] = std::move(payload);
    }

    LOG_DEBUG("STORE: " + m.object_id + ": manifest + " + std::to_string(obj.chunks.size()) + " chunk(s)");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_objects[m.object_id] = std::move(obj);
    return true;
}

// ============================================================================
// ACCESS
// ============================================================================

bool ChunkStore::put(const std::string& topic, const std::string& payload, std::string* error) {
    ParsedTopic parsed;
    if (!m_topics.parse(topic, parsed) || (parsed.role != TopicRole::MANIFEST && parsed.role != TopicRole::CHUNK)) {
        if (error) *error = "topic not stored: " + topic;
        return false;
    }

    bool replaced_manifest = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        StoredObject& obj = m_objects[parsed.object_id];
        if (parsed.role == TopicRole::MANIFEST) {
            if (obj.manifest == payload) {
                return true;
            }
            replaced_manifest = !obj.manifest.empty();
            if (replaced_manifest) {
                obj.chunks.clear();
            }
            obj.manifest = payload;
        } else {
            obj.chunks[parsed.chunk_index] = payload;
        }
    }
    if (replaced_manifest) {
        LOG_INFO("STORE: New version of " + parsed.object_id + ", previous chunks dropped");
    }

    if (m_directory.empty()) {
        return true;
    }

    const std::string dir = object_dir(parsed.object_id);
    std::error_code ec;
    if (replaced_manifest) {
        fs::remove_all(dir, ec);
    }
    fs::create_directories(dir, ec);
    if (ec) {
        if (error) *error = "cannot create " + dir + ": " + ec.message();
        return false;
    }
    const std::string file = parsed.role == TopicRole::MANIFEST ? std::string(kMetadataFile)
                                                                : std::to_string(parsed.chunk_index);
    return write_file((fs::path(dir) / file).string(), payload, error);
}

bool ChunkStore::get(const std::string& topic, std::string& payload) const {
    ParsedTopic parsed;
    if (!m_topics.parse(topic, parsed)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_objects.find(parsed.object_id);
    if (it == m_objects.end()) {
        return false;
    }
    if (parsed.role == TopicRole::MANIFEST) {
        if (it->second.manifest.empty()) return false;
        payload = it->second.manifest;
        return true;
    }
    if (parsed.role == TopicRole::CHUNK) {
        auto c = it->second.chunks.find(parsed.chunk_index);
        if (c == it->second.chunks.end()) return false;
        payload = c->second;
        return true;
    }
    return false;
}

std::vector<std::pair<std::string, std::string>> ChunkStore::match(const std::string& selector) const {
    std::vector<std::pair<std::string, std::string>> manifests;
    std::vector<std::pair<std::string, std::string>> chunks;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& kv : m_objects) {
        const std::string manifest_topic = m_topics.manifest_topic(kv.first);
        if (!kv.second.manifest.empty() && topic_matches(selector, manifest_topic)) {
            manifests.emplace_back(manifest_topic, kv.second.manifest);
        }
        for (const auto& chunk : kv.second.chunks) {
            const std::string chunk_topic = m_topics.chunk_topic(kv.first, chunk.first);
            if (topic_matches(selector, chunk_topic)) {
                chunks.emplace_back(chunk_topic, chunk.second);
            }
        }
    }

    manifests.insert(manifests.end(), std::make_move_iterator(chunks.begin()), std::make_move_iterator(chunks.end()));
    return manifests;
}

bool ChunkStore::remove_object(const std::string& object_id, std::string* error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_objects.erase(object_id) == 0) {
            if (error) *error = "no such object: " + object_id;
            return false;
        }
    }
    if (!m_directory.empty()) {
        std::error_code ec;
        fs::remove_all(object_dir(object_id), ec);
        if (ec) {
            if (error) *error = "cannot remove " + object_id + ": " + ec.message();
            return false;
        }
    }
    LOG_INFO("STORE: Removed " + object_id);
    return true;
}

size_t ChunkStore::object_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_objects.size();
}

size_t ChunkStore::entry_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (const auto& kv : m_objects) {
        n += (kv.second.manifest.empty() ? 0 : 1) + kv.second.chunks.size();
    }
    return n;
}

} // namespace litecdn
