#include "upload_session.h"
#include "chunk_codec.h"
#include "logger.h"
#include "transfer_messages.h"

namespace litecdn {

UploadSession::UploadSession(std::string object_id,
                             std::vector<uint8_t> data,
                             TransferOptions options,
                             std::shared_ptr<SessionContext> ctx,
                             TransferCallback on_done)
    : TransferSession(std::move(object_id), TransferDirection::UPLOAD, std::move(options), std::move(ctx),
                      std::move(on_done)),
      m_data(std::move(data)) {}

UploadSession::~UploadSession() {
    if (!is_finished()) {
        release_resources();
    }
}

// ============================================================================
// START / PREPARE
// ============================================================================

void UploadSession::start() {
    if (m_ctx->stats) m_ctx->stats->uploads_started++;
    set_state(SessionState::PUBLISHING, "start");

    if (!prepare()) {
        return;
    }
    if (m_options.await_ack && !subscribe_control()) {
        return;
    }

    std::string error;
    if (!m_ctx->transport->publish(m_ctx->topics.manifest_topic(m_object_id), m_manifest_payload, &error)) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "manifest publish failed: " + error);
        return;
    }
    LOG_INFO("UP: Published manifest for " + m_object_id + " (" + std::to_string(m_manifest.total_size) +
             " bytes, " + std::to_string(m_manifest.chunk_count) + " chunk(s) of " +
             std::to_string(m_manifest.chunk_size) + ", " + m_manifest.digest_algorithm + ")");

    if (m_options.parallel_publish && m_frames.size() > 1) {
        publish_parallel();
    } else {
        publish_sequential();
    }
}

bool UploadSession::prepare() {
    std::string error;
    if (!TopicScheme::validate_object_id(m_object_id, &error)) {
        fail(TransferErrorKind::INVALID_ARGUMENT, "invalid object id: " + error);
        return false;
    }

    auto verifier = m_ctx->digests->find(m_options.digest_algorithm);
    if (!verifier) {
        fail(TransferErrorKind::INVALID_ARGUMENT, "unknown digest algorithm '" + m_options.digest_algorithm + "'");
        return false;
    }

    const size_t max_message = m_ctx->transport->max_message_size();
    if (!chunk_codec::validate_chunk_size(m_options.chunk_size, m_object_id, *verifier, max_message, &error)) {
        fail(TransferErrorKind::FORMAT_ERROR, error);
        return false;
    }

    std::vector<Chunk> chunks;
    if (!manifest::build(m_object_id, m_data, m_options.chunk_size, *verifier, m_options.file_name,
                         m_manifest, &error, &chunks)) {
        fail(TransferErrorKind::FORMAT_ERROR, error);
        return false;
    }

    m_manifest_payload = manifest::encode(m_manifest);
    if (m_manifest_payload.size() > max_message) {
        fail(TransferErrorKind::FORMAT_ERROR,
             "manifest of " + std::to_string(m_manifest_payload.size()) + " bytes exceeds the transport limit of " +
             std::to_string(max_message) + "; use a larger chunk size");
        return false;
    }

    m_frames.resize(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (!chunk_codec::serialize(chunks[i], m_frames[i], &error)) {
            fail(TransferErrorKind::FORMAT_ERROR, "chunk " + std::to_string(i) + ": " + error);
            return false;
        }
    }
    m_chunk_count = static_cast<uint32_t>(m_frames.size());

    // frames now hold every byte
    std::vector<uint8_t>().swap(m_data);
    return true;
}

bool UploadSession::subscribe_control() {
    std::weak_ptr<UploadSession> weak = shared_from_this();
    std::string error;

    SubscriptionId ack_sub = m_ctx->transport->subscribe(
        m_ctx->topics.ack_topic(m_object_id),
        [weak](const std::string&, const std::string& payload) {
            if (auto self = weak.lock()) self->on_ack(payload);
        },
        &error);
    if (ack_sub == 0) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "ack subscription failed: " + error);
        return false;
    }

    SubscriptionId retx_sub = m_ctx->transport->subscribe(
        m_ctx->topics.retransmit_topic(m_object_id),
        [weak](const std::string&, const std::string& payload) {
            if (auto self = weak.lock()) self->on_retransmit_request(payload);
        },
        &error);

    bool released = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released = m_released;
        if (!released) {
            m_ack_sub = ack_sub;
            m_retransmit_sub = retx_sub;
        }
    }
    if (released) {
        m_ctx->transport->unsubscribe(ack_sub);
        if (retx_sub != 0) m_ctx->transport->unsubscribe(retx_sub);
        return false;
    }
    if (retx_sub == 0) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "retransmit subscription failed: " + error);
        return false;
    }
    return true;
}

// ============================================================================
// PUBLISHING
// ============================================================================

bool UploadSession::publish_frame(uint32_t index) {
    std::string error;
    if (!m_ctx->transport->publish(m_ctx->topics.chunk_topic(m_object_id, index), m_frames[index], &error)) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "chunk " + std::to_string(index) + " publish failed: " + error);
        return false;
    }
    if (m_ctx->stats) {
        m_ctx->stats->chunks_published++;
        m_ctx->stats->bytes_uploaded += m_manifest.expected_chunk_length(index);
    }
    return true;
}

void UploadSession::publish_sequential() {
    for (uint32_t i = 0; i < m_frames.size(); ++i) {
        if (is_finished()) {
            return;
        }
        if (!publish_frame(i)) {
            return;
        }
        m_published++;
    }
    on_all_published();
}

void UploadSession::publish_parallel() {
    auto self = shared_from_this();
    const uint32_t count = static_cast<uint32_t>(m_frames.size());
    m_pending_parallel = count;

    for (uint32_t i = 0; i < count; ++i) {
        const bool queued = m_ctx->pool->submit_any([self, i]() {
            if (!self->is_finished() && self->publish_frame(i)) {
                self->m_published++;
            }
            if (--self->m_pending_parallel == 0) {
                self->on_all_published();
            }
        });
        if (!queued) {
            fail(TransferErrorKind::TRANSPORT_ERROR, "worker pool is shut down");
            return;
        }
    }
}

void UploadSession::on_all_published() {
    if (is_finished() || m_published.load() != m_frames.size()) {
        return;
    }
    LOG_INFO("UP: All " + std::to_string(m_frames.size()) + " chunk(s) of " + m_object_id + " handed to transport");

    if (!m_options.await_ack) {
        resolve(success_result());
        return;
    }

    set_state(SessionState::AWAITING_ACK, "published");
    std::weak_ptr<UploadSession> weak = shared_from_this();
    TimerId timer = m_ctx->timers->runAfter(m_options.ack_timeout_ms, [weak]() {
        if (auto self = weak.lock()) self->on_ack_timeout();
    });

    bool released = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released = m_released;
        if (!released) m_ack_timer = timer;
    }
    if (released) {
        m_ctx->timers->cancelTimer(timer);
    }
}

// ============================================================================
// ACK / RETRANSMISSION
// ============================================================================

void UploadSession::on_retransmit_request(const std::string& payload) {
    if (is_finished()) {
        return;
    }

    RetransmitRequest req;
    std::string error;
    if (!transfer_messages::decode_retransmit(payload, req, &error)) {
        LOG_WARN("UP: Ignoring malformed retransmit request for " + m_object_id + ": " + error);
        return;
    }
    if (req.object_id != m_object_id) {
        return;
    }

    m_requests_served++;
    if (m_ctx->stats) m_ctx->stats->retransmit_requests_served++;
    LOG_DEBUG("UP: Retransmit request for " + m_object_id + ": manifest=" + (req.manifest ? "yes" : "no") +
              ", " + std::to_string(req.indices.size()) + " chunk(s)");

    if (req.manifest &&
        !m_ctx->transport->publish(m_ctx->topics.manifest_topic(m_object_id), m_manifest_payload, &error)) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "manifest republish failed: " + error);
        return;
    }
    for (uint32_t index : req.indices) {
        if (index >= m_frames.size()) {
            LOG_WARN("UP: Retransmit request names chunk " + std::to_string(index) + " beyond " +
                     std::to_string(m_frames.size()) + " for " + m_object_id);
            continue;
        }
        if (is_finished() || !publish_frame(index)) {
            return;
        }
    }
}

void UploadSession::on_ack(const std::string& payload) {
    if (is_finished()) {
        return;
    }

    TransferAck ack;
    std::string error;
    if (!transfer_messages::decode_ack(payload, ack, &error)) {
        LOG_WARN("UP: Ignoring malformed ack for " + m_object_id + ": " + error);
        return;
    }
    if (ack.object_id != m_object_id || !digests_equal(ack.object_digest, m_manifest.object_digest)) {
        LOG_WARN("UP: Ack for " + m_object_id + " carries a different object digest, ignored");
        return;
    }
    LOG_INFO("UP: " + m_object_id + " acknowledged by destination");
    resolve(success_result());
}

void UploadSession::on_ack_timeout() {
    fail(TransferErrorKind::TIMEOUT_ERROR,
         "no acknowledgment within " + std::to_string(m_options.ack_timeout_ms) + " ms");
}

void UploadSession::cancel() {
    fail(TransferErrorKind::CANCELLED, "upload cancelled");
}

TransferResult UploadSession::success_result() const {
    TransferResult result;
    result.success = true;
    result.manifest = m_manifest;
    result.chunks_transferred = m_published.load();
    result.retransmit_rounds = m_requests_served.load();
    return result;
}

void UploadSession::release_resources() {
    SubscriptionId ack_sub = 0;
    SubscriptionId retx_sub = 0;
    TimerId timer = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_released) return;
        m_released = true;
        std::swap(ack_sub, m_ack_sub);
        std::swap(retx_sub, m_retransmit_sub);
        std::swap(timer, m_ack_timer);
    }
    if (ack_sub != 0) m_ctx->transport->unsubscribe(ack_sub);
    if (retx_sub != 0) m_ctx->transport->unsubscribe(retx_sub);
    if (timer != 0) m_ctx->timers->cancelTimer(timer);
}

} // namespace litecdn
