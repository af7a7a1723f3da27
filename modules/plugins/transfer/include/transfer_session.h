#ifndef LITECDN_TRANSFER_SESSION_H
#define LITECDN_TRANSFER_SESSION_H

#include "digest_registry.h"
#include "event_thread_pool.h"
#include "pubsub_transport.h"
#include "timer_queue.h"
#include "topic_scheme.h"
#include "transfer_types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace litecdn {

/**
 * Resources one TransferManager shares with all of its sessions. Sessions keep it
 * alive through shared_ptr, so a late transport callback never sees a dead pool or
 * timer queue. The transport itself must outlive the manager.
 */
struct SessionContext {
    PubSubTransport* transport = nullptr;
    TopicScheme topics;
    std::shared_ptr<DigestRegistry> digests;
    std::shared_ptr<EventThreadPool> pool;
    std::shared_ptr<TimerQueue> timers;
    std::shared_ptr<TransferStatistics> stats;
};

/**
 * One upload or one download of one object.
 *
 * A session resolves exactly once: resolve() releases subscriptions and timers,
 * then invokes the completion callback. Later resolve() calls are no-ops, which
 * is what makes racing completion, timeout and cancel safe.
 */
class TransferSession {
public:
    TransferSession(std::string object_id,
                    TransferDirection direction,
                    TransferOptions options,
                    std::shared_ptr<SessionContext> ctx,
                    TransferCallback on_done);
    virtual ~TransferSession() = default;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Errors surface through the completion callback, possibly before start() returns.
    virtual void start() = 0;
    virtual void cancel() = 0;

    const std::string& object_id() const { return m_object_id; }
    TransferDirection direction() const { return m_direction; }
    SessionState state() const { return m_state.load(); }
    bool is_finished() const { return m_resolved.load(); }

protected:
    // Returns false if the session was already resolved.
    bool resolve(TransferResult result);
    bool fail(TransferErrorKind kind, const std::string& message, std::vector<uint32_t> missing = {});

    void set_state(SessionState next, const char* event);

    // Drop subscriptions and timers. Called once, from resolve(), before the callback.
    virtual void release_resources() = 0;

    const char* log_tag() const { return m_direction == TransferDirection::UPLOAD ? "UP" : "DL"; }

    const std::string m_object_id;
    const TransferDirection m_direction;
    const TransferOptions m_options;
    std::shared_ptr<SessionContext> m_ctx;

private:
    TransferCallback m_on_done;
    std::atomic<bool> m_resolved{false};
    std::atomic<SessionState> m_state{SessionState::PENDING};
    std::chrono::steady_clock::time_point m_created_at;
};

} // namespace litecdn

#endif // LITECDN_TRANSFER_SESSION_H
