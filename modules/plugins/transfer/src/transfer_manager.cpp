#include "transfer_manager.h"
#include "logger.h"

#include <condition_variable>
#include <future>

namespace litecdn {

TransferManager::TransferManager(PubSubTransport& transport,
                                 std::string resource_root,
                                 size_t worker_threads,
                                 std::shared_ptr<DigestRegistry> digests)
    : m_ctx(std::make_shared<SessionContext>()) {
    m_ctx->transport = &transport;
    m_ctx->topics = TopicScheme(std::move(resource_root));
    m_ctx->digests = digests ? std::move(digests) : DigestRegistry::defaults();
    m_ctx->pool = std::make_shared<EventThreadPool>(worker_threads);
    m_ctx->timers = std::make_shared<TimerQueue>();
    m_ctx->stats = std::make_shared<TransferStatistics>();
    m_ctx->timers->start();

    LOG_INFO("TM: Transfer manager ready on " + m_ctx->topics.root() + " (" +
             std::to_string(m_ctx->pool->worker_count()) + " worker(s), max message " +
             std::to_string(transport.max_message_size()) + " bytes)");
}

TransferManager::~TransferManager() {
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_shutting_down = true;
    }
    cancel_all();
    m_ctx->timers->stop();
    m_ctx->pool->shutdown(true);
    LOG_INFO("TM: Transfer manager stopped");
}

// ============================================================================
// SESSION TABLE
// ============================================================================

bool TransferManager::register_session(std::map<std::string, Entry>& table,
                                       const std::string& object_id,
                                       const std::shared_ptr<TransferSession>& session,
                                       uint64_t generation) {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    if (m_shutting_down || table.count(object_id) != 0) {
        return false;
    }
    table[object_id] = Entry{generation, session};
    return true;
}

void TransferManager::unregister_session(TransferDirection direction, const std::string& object_id,
                                         uint64_t generation) {
    std::shared_ptr<TransferSession> doomed;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        auto& table = direction == TransferDirection::UPLOAD ? m_uploads : m_downloads;
        auto it = table.find(object_id);
        if (it != table.end() && it->second.generation == generation) {
            doomed = std::move(it->second.session);
            table.erase(it);
        }
    }
    // doomed is released here, outside the lock
}

TransferCallback TransferManager::wrap_callback(TransferDirection direction,
                                                const std::string& object_id,
                                                uint64_t generation,
                                                TransferCallback user_cb) {
    return [this, direction, object_id, generation, user_cb](const TransferResult& result) {
        // the slot frees before the user sees the result, so a callback may start a new transfer
        unregister_session(direction, object_id, generation);
        if (user_cb) {
            user_cb(result);
        }
    };
}

std::shared_ptr<TransferSession> TransferManager::find(TransferDirection direction,
                                                       const std::string& object_id) const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    const auto& table = direction == TransferDirection::UPLOAD ? m_uploads : m_downloads;
    auto it = table.find(object_id);
    return it == table.end() ? nullptr : it->second.session;
}

TransferResult TransferManager::busy_result(const std::string& object_id, TransferDirection direction,
                                            const std::string& message) {
    TransferResult result;
    result.success = false;
    result.object_id = object_id;
    result.direction = direction;
    result.error.kind = TransferErrorKind::BUSY;
    result.error.message = message;
    return result;
}

// ============================================================================
// ASYNC API
// ============================================================================

bool TransferManager::start_upload(const std::string& object_id,
                                   std::vector<uint8_t> data,
                                   const TransferOptions& options,
                                   TransferCallback on_done) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        generation = m_next_generation++;
    }

    auto session = std::make_shared<UploadSession>(
        object_id, std::move(data), options, m_ctx,
        wrap_callback(TransferDirection::UPLOAD, object_id, generation, on_done));

    if (!register_session(m_uploads, object_id, session, generation)) {
        LOG_WARN("TM: Upload of " + object_id + " refused, object busy or manager stopping");
        if (on_done) on_done(busy_result(object_id, TransferDirection::UPLOAD, "upload already in progress"));
        return false;
    }
    session->start();
    return true;
}

bool TransferManager::start_download(const std::string& object_id,
                                     const TransferOptions& options,
                                     TransferCallback on_done) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        generation = m_next_generation++;
    }

    auto session = std::make_shared<DownloadSession>(
        object_id, options, m_ctx,
        wrap_callback(TransferDirection::DOWNLOAD, object_id, generation, on_done));

    if (!register_session(m_downloads, object_id, session, generation)) {
        LOG_WARN("TM: Download of " + object_id + " refused, object busy or manager stopping");
        if (on_done) on_done(busy_result(object_id, TransferDirection::DOWNLOAD, "download already in progress"));
        return false;
    }
    session->start();
    return true;
}

// ============================================================================
// BLOCKING API
// ============================================================================

TransferResult TransferManager::upload(const std::string& object_id,
                                       std::vector<uint8_t> data,
                                       const TransferOptions& options) {
    auto promise = std::make_shared<std::promise<TransferResult>>();
    std::future<TransferResult> future = promise->get_future();
    start_upload(object_id, std::move(data), options,
                 [promise](const TransferResult& result) { promise->set_value(result); });
    return future.get();
}

TransferResult TransferManager::download(const std::string& object_id, const TransferOptions& options) {
    auto promise = std::make_shared<std::promise<TransferResult>>();
    std::future<TransferResult> future = promise->get_future();
    start_download(object_id, options,
                   [promise](const TransferResult& result) { promise->set_value(result); });
    return future.get();
}

// ============================================================================
// CONTROL / QUERIES
// ============================================================================

bool TransferManager::cancel_upload(const std::string& object_id) {
    auto session = find(TransferDirection::UPLOAD, object_id);
    if (!session) {
        return false;
    }
    session->cancel();
    return true;
}

bool TransferManager::cancel_download(const std::string& object_id) {
    auto session = find(TransferDirection::DOWNLOAD, object_id);
    if (!session) {
        return false;
    }
    session->cancel();
    return true;
}

bool TransferManager::cancel(const std::string& object_id) {
    const bool up = cancel_upload(object_id);
    const bool down = cancel_download(object_id);
    return up || down;
}

void TransferManager::cancel_all() {
    std::vector<std::shared_ptr<TransferSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (const auto& kv : m_uploads) sessions.push_back(kv.second.session);
        for (const auto& kv : m_downloads) sessions.push_back(kv.second.session);
    }
    if (!sessions.empty()) {
        LOG_INFO("TM: Cancelling " + std::to_string(sessions.size()) + " active session(s)");
    }
    for (auto& session : sessions) {
        session->cancel();
    }
}

bool TransferManager::list_objects(int timeout_ms, std::vector<ObjectManifest>& out, std::string* error) {
    out.clear();
    if (!m_ctx->transport->supports_query()) {
        if (error) *error = "transport does not support queries";
        return false;
    }

    struct ListState {
        std::mutex mutex;
        std::condition_variable cv;
        std::map<std::string, ObjectManifest> found;
        bool done = false;
    };
    auto state = std::make_shared<ListState>();

    std::string query_error;
    const bool issued = m_ctx->transport->query(
        m_ctx->topics.all_manifests_pattern(),
        [state](const std::string& topic, const std::string& payload) {
            ObjectManifest m;
            std::string err;
            if (!manifest::decode(payload, m, &err)) {
                LOG_WARN("TM: Skipping unreadable manifest on " + topic + ": " + err);
                return;
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            state->found[m.object_id] = std::move(m);
        },
        [state]() {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->done = true;
            state->cv.notify_all();
        },
        &query_error);
    if (!issued) {
        if (error) *error = "query failed: " + query_error;
        return false;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool finished = state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                             [&state]() { return state->done; });
    for (const auto& kv : state->found) {
        out.push_back(kv.second);
    }
    if (!finished) {
        if (error) *error = "listing timed out after " + std::to_string(timeout_ms) + " ms";
        return false;
    }
    return true;
}

size_t TransferManager::active_uploads() const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    return m_uploads.size();
}

size_t TransferManager::active_downloads() const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    return m_downloads.size();
}

bool TransferManager::is_active(const std::string& object_id) const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    return m_uploads.count(object_id) != 0 || m_downloads.count(object_id) != 0;
}

std::vector<uint32_t> TransferManager::missing_indices(const std::string& object_id) const {
    auto session = std::dynamic_pointer_cast<DownloadSession>(find(TransferDirection::DOWNLOAD, object_id));
    return session ? session->missing_indices() : std::vector<uint32_t>{};
}

std::map<std::string, double> TransferManager::get_statistics() const {
    auto stats = m_ctx->stats->snapshot();
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    stats["active_uploads"] = static_cast<double>(m_uploads.size());
    stats["active_downloads"] = static_cast<double>(m_downloads.size());
    return stats;
}

void TransferManager::reset_statistics() {
    m_ctx->stats->reset();
}

} // namespace litecdn
