#include "transfer_session.h"
#include "logger.h"

namespace litecdn {

TransferSession::TransferSession(std::string object_id,
                                 TransferDirection direction,
                                 TransferOptions options,
                                 std::shared_ptr<SessionContext> ctx,
                                 TransferCallback on_done)
    : m_object_id(std::move(object_id)),
      m_direction(direction),
      m_options(std::move(options)),
      m_ctx(std::move(ctx)),
      m_on_done(std::move(on_done)),
      m_created_at(std::chrono::steady_clock::now()) {}

void TransferSession::set_state(SessionState next, const char* event) {
    const SessionState old_state = m_state.exchange(next);
    if (old_state == next) {
        return;
    }
    LOG_DEBUG(std::string(log_tag()) + ": " + m_object_id + " " + session_state_to_string(old_state) +
              " --(" + event + ")--> " + session_state_to_string(next));
}

bool TransferSession::resolve(TransferResult result) {
    if (m_resolved.exchange(true)) {
        return false;
    }

    release_resources();

    result.object_id = m_object_id;
    result.direction = m_direction;
    result.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_created_at).count());

    const bool upload = m_direction == TransferDirection::UPLOAD;
    if (result.success) {
        set_state(SessionState::COMPLETED, "resolved");
        if (m_ctx->stats) (upload ? m_ctx->stats->uploads_completed : m_ctx->stats->downloads_completed)++;
        LOG_INFO(std::string(log_tag()) + ": " + m_object_id + " completed in " +
                 std::to_string(result.elapsed_ms) + " ms (" + std::to_string(result.chunks_transferred) +
                 " chunk(s), " + std::to_string(result.retransmit_rounds) + " retransmission round(s))");
    } else {
        const bool cancelled = result.error.kind == TransferErrorKind::CANCELLED;
        set_state(cancelled ? SessionState::CANCELLED : SessionState::FAILED, "resolved");
        if (m_ctx->stats) (upload ? m_ctx->stats->uploads_failed : m_ctx->stats->downloads_failed)++;
        LOG_WARN(std::string(log_tag()) + ": " + m_object_id + " failed: " + result.error.to_string());
    }

    if (m_on_done) {
        // the callback may drop the last owner of this session
        TransferCallback cb = std::move(m_on_done);
        m_on_done = nullptr;
        cb(result);
    }
    return true;
}

bool TransferSession::fail(TransferErrorKind kind, const std::string& message, std::vector<uint32_t> missing) {
    TransferResult result;
    result.success = false;
    result.error.kind = kind;
    result.error.message = message;
    result.error.missing_indices = std::move(missing);
    return resolve(std::move(result));
}

} // namespace litecdn
