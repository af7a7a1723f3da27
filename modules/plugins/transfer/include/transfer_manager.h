#ifndef LITECDN_TRANSFER_MANAGER_H
#define LITECDN_TRANSFER_MANAGER_H

#include "download_session.h"
#include "transfer_session.h"
#include "transfer_types.h"
#include "upload_session.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

/**
 * TRANSFER MANAGER
 *
 * Entry point for applications. Owns the worker pool, the timer queue and the
 * statistics, and keeps at most one upload and one download per object id.
 * Sessions for different objects never share state, so a stalled or corrupted
 * object cannot hold up another.
 *
 * The asynchronous calls report through the callback, which runs on a transport,
 * pool or timer thread. upload()/download() block the caller until the session
 * resolves; download() waits for Complete or Abandoned, never longer than the
 * configured deadline.
 */
class TransferManager {
public:
    explicit TransferManager(PubSubTransport& transport,
                             std::string resource_root = kDefaultResourceRoot,
                             size_t worker_threads = 4,
                             std::shared_ptr<DigestRegistry> digests = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // ========================================================================
    // ASYNC API
    // ========================================================================

    // Returns false (and still reports through the callback) when the object
    // already has a session in that direction or the manager is shutting down.
    bool start_upload(const std::string& object_id,
                      std::vector<uint8_t> data,
                      const TransferOptions& options,
                      TransferCallback on_done);
    bool start_download(const std::string& object_id, const TransferOptions& options, TransferCallback on_done);

    // ========================================================================
    // BLOCKING API
    // ========================================================================

    TransferResult upload(const std::string& object_id, std::vector<uint8_t> data, const TransferOptions& options);
    TransferResult download(const std::string& object_id, const TransferOptions& options);

    // ========================================================================
    // CONTROL / QUERIES
    // ========================================================================

    bool cancel_upload(const std::string& object_id);
    bool cancel_download(const std::string& object_id);
    bool cancel(const std::string& object_id);   // both directions
    void cancel_all();

    // Collects stored manifests under the root. Needs a transport with query support.
    bool list_objects(int timeout_ms, std::vector<ObjectManifest>& out, std::string* error);

    size_t active_uploads() const;
    size_t active_downloads() const;
    bool is_active(const std::string& object_id) const;

    // Missing chunk indices of an active download (empty if none or no manifest yet).
    std::vector<uint32_t> missing_indices(const std::string& object_id) const;

    std::map<std::string, double> get_statistics() const;
    void reset_statistics();

    const TopicScheme& topics() const { return m_ctx->topics; }

private:
    struct Entry {
        uint64_t generation = 0;
        std::shared_ptr<TransferSession> session;
    };

    bool register_session(std::map<std::string, Entry>& table,
                          const std::string& object_id,
                          const std::shared_ptr<TransferSession>& session,
                          uint64_t generation);
    void unregister_session(TransferDirection direction, const std::string& object_id, uint64_t generation);
    TransferCallback wrap_callback(TransferDirection direction,
                                   const std::string& object_id,
                                   uint64_t generation,
                                   TransferCallback user_cb);
    std::shared_ptr<TransferSession> find(TransferDirection direction, const std::string& object_id) const;

    static TransferResult busy_result(const std::string& object_id, TransferDirection direction,
                                      const std::string& message);

    std::shared_ptr<SessionContext> m_ctx;

    mutable std::mutex m_sessions_mutex;
    std::map<std::string, Entry> m_uploads;
    std::map<std::string, Entry> m_downloads;
    uint64_t m_next_generation = 1;
    bool m_shutting_down = false;
};

} // namespace litecdn

#endif // LITECDN_TRANSFER_MANAGER_H
