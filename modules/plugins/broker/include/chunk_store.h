#ifndef LITECDN_CHUNK_STORE_H
#define LITECDN_CHUNK_STORE_H

#include "digest_registry.h"
#include "topic_scheme.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace litecdn {

/**
 * Opaque manifest/chunk payloads, keyed by topic.
 *
 * Only manifest and chunk topics under the resource root are kept. With a
 * directory, every object gets <dir>/<sha256(object_id) hex>/ holding "metadata"
 * (the manifest payload) and one file per chunk named by its decimal index.
 * Payloads are stored as received and never decoded here, except that load()
 * reads the object id back out of each stored manifest.
 *
 * A manifest that differs from the stored one replaces it and drops the object's
 * chunks, since they belong to the previous version.
 */
class ChunkStore {
public:
    // Empty directory: memory only.
    ChunkStore(TopicScheme topics, std::string directory = "");

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Reads everything persisted under the directory. Unreadable entries are logged
    // and skipped.
    bool load(std::string* error);

    // Returns false for topics the store does not keep, or on a write error.
    bool put(const std::string& topic, const std::string& payload, std::string* error);
    bool get(const std::string& topic, std::string& payload) const;

    // Stored (topic, payload) pairs matching a selector, manifests first.
    std::vector<std::pair<std::string, std::string>> match(const std::string& selector) const;

    bool remove_object(const std::string& object_id, std::string* error);

    size_t object_count() const;
    size_t entry_count() const;
    const std::string& directory() const { return m_directory; }

private:
    struct StoredObject {
        std::string manifest;
        std::map<uint32_t, std::string> chunks;
    };

    std::string object_dir(const std::string& object_id) const;
    bool write_file(const std::string& path, const std::string& payload, std::string* error) const;
    bool load_object_dir(const std::string& path);

    TopicScheme m_topics;
    std::string m_directory;
    std::shared_ptr<const IntegrityVerifier> m_path_hash;

    mutable std::mutex m_mutex;
    std::map<std::string, StoredObject> m_objects;
};

} // namespace litecdn

#endif // LITECDN_CHUNK_STORE_H
