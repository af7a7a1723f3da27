#include "download_session.h"
#include "chunk_codec.h"
#include "logger.h"
#include "transfer_messages.h"

namespace litecdn {

DownloadSession::DownloadSession(std::string object_id,
                                 TransferOptions options,
                                 std::shared_ptr<SessionContext> ctx,
                                 TransferCallback on_done)
    : TransferSession(std::move(object_id), TransferDirection::DOWNLOAD, std::move(options), std::move(ctx),
                      std::move(on_done)) {}

DownloadSession::~DownloadSession() {
    if (!is_finished()) {
        release_resources();
    }
}

std::shared_ptr<ReassemblyBuffer> DownloadSession::buffer() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer;
}

std::vector<uint32_t> DownloadSession::missing_indices() const {
    auto buf = buffer();
    return buf ? buf->missing_indices() : std::vector<uint32_t>{};
}

uint32_t DownloadSession::received_count() const {
    auto buf = buffer();
    return buf ? buf->received_count() : 0;
}

// ============================================================================
// START
// ============================================================================

void DownloadSession::start() {
    if (m_ctx->stats) m_ctx->stats->downloads_started++;
    set_state(SessionState::RECEIVING, "start");

    std::string error;
    if (!TopicScheme::validate_object_id(m_object_id, &error)) {
        fail(TransferErrorKind::INVALID_ARGUMENT, "invalid object id: " + error);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer = std::make_shared<ReassemblyBuffer>(m_object_id);
    }

    if (!subscribe_topics()) {
        return;
    }
    start_timers();
    if (is_finished()) {
        return;
    }

    LOG_INFO("DL: Waiting for " + m_object_id + " under " + m_ctx->topics.root());
    query_manifest();
}

bool DownloadSession::subscribe_topics() {
    std::weak_ptr<DownloadSession> weak = shared_from_this();
    std::string error;

    SubscriptionId manifest_sub = m_ctx->transport->subscribe(
        m_ctx->topics.manifest_topic(m_object_id),
        [weak](const std::string&, const std::string& payload) {
            if (auto self = weak.lock()) self->on_manifest(payload);
        },
        &error);
    if (manifest_sub == 0) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "manifest subscription failed: " + error);
        return false;
    }

    SubscriptionId chunk_sub = m_ctx->transport->subscribe(
        m_ctx->topics.chunk_pattern(m_object_id),
        [weak](const std::string& topic, const std::string& payload) {
            if (auto self = weak.lock()) self->on_chunk(topic, payload);
        },
        &error);

    bool released = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released = m_released;
        if (!released) {
            m_manifest_sub = manifest_sub;
            m_chunk_sub = chunk_sub;
        }
    }
    if (released) {
        m_ctx->transport->unsubscribe(manifest_sub);
        if (chunk_sub != 0) m_ctx->transport->unsubscribe(chunk_sub);
        return false;
    }
    if (chunk_sub == 0) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "chunk subscription failed: " + error);
        return false;
    }
    return true;
}

void DownloadSession::start_timers() {
    std::weak_ptr<DownloadSession> weak = shared_from_this();

    TimerId deadline = 0;
    if (m_options.download_timeout_ms > 0) {
        deadline = m_ctx->timers->runAfter(m_options.download_timeout_ms, [weak]() {
            if (auto self = weak.lock()) self->on_deadline();
        });
    }
    const int interval = m_options.retransmit_interval_ms > 0 ? m_options.retransmit_interval_ms
                                                              : DEFAULT_RETRANSMIT_INTERVAL_MS;
    TimerId tick = m_ctx->timers->runEvery(interval, [weak]() {
        if (auto self = weak.lock()) self->on_tick();
    });

    bool released = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released = m_released;
        if (!released) {
            m_deadline_timer = deadline;
            m_tick_timer = tick;
        }
    }
    if (released) {
        if (deadline != 0) m_ctx->timers->cancelTimer(deadline);
        if (tick != 0) m_ctx->timers->cancelTimer(tick);
        return;
    }
    if (tick == 0) {
        fail(TransferErrorKind::TRANSPORT_ERROR, "timer queue is stopped");
    }
}

void DownloadSession::query_manifest() {
    if (!m_ctx->transport->supports_query()) {
        request(true, {});
        return;
    }

    std::weak_ptr<DownloadSession> weak = shared_from_this();
    std::string error;
    const bool issued = m_ctx->transport->query(
        m_ctx->topics.manifest_topic(m_object_id),
        [weak](const std::string&, const std::string& payload) {
            if (auto self = weak.lock()) self->on_manifest(payload);
        },
        [weak]() {
            auto self = weak.lock();
            if (!self || self->is_finished()) return;
            auto buf = self->buffer();
            if (buf && !buf->has_manifest()) {
                // nothing stored yet; ask a live source
                self->request(true, {});
            }
        },
        &error);
    if (!issued) {
        LOG_DEBUG("DL: Manifest query for " + m_object_id + " not issued: " + error);
        request(true, {});
    }
}

// ============================================================================
// INBOUND
// ============================================================================

void DownloadSession::on_manifest(const std::string& payload) {
    if (is_finished()) {
        return;
    }
    auto buf = buffer();
    if (!buf) {
        return;
    }

    ObjectManifest m;
    std::string error;
    if (!manifest::decode(payload, m, &error)) {
        // treated as a lost manifest; the next tick asks again
        if (m_ctx->stats) m_ctx->stats->malformed_frames++;
        LOG_WARN("DL: Dropping malformed manifest for " + m_object_id + ": " + error);
        return;
    }
    if (m.object_id != m_object_id) {
        LOG_WARN("DL: Manifest names object '" + m.object_id + "' on the topic of " + m_object_id + ", dropped");
        return;
    }

    const bool first = !buf->has_manifest();
    if (first && !fits_transport(m)) {
        return;
    }
    if (!buf->apply_manifest(m, *m_ctx->digests, &error)) {
        LOG_WARN("DL: Manifest for " + m_object_id + " rejected: " + error);
        return;
    }
    if (!first) {
        return;
    }

    LOG_INFO("DL: Manifest for " + m_object_id + ": " + std::to_string(m.total_size) + " bytes in " +
             std::to_string(m.chunk_count) + " chunk(s), " + m.digest_algorithm);
    if (buf->state() == ReassemblyState::COMPLETE) {
        finish_complete();
        return;
    }

    // the manifest is progress: the chunk budget starts fresh
    m_stalled_rounds = 0;
    m_last_received = 0;

    const auto missing = buf->missing_indices();
    if (!missing.empty()) {
        request(false, missing);
    }
}

bool DownloadSession::fits_transport(const ObjectManifest& m) {
    auto verifier = m_ctx->digests->find(m.digest_algorithm);
    if (!verifier) {
        // apply_manifest reports the unknown algorithm
        return true;
    }
    std::string error;
    if (chunk_codec::validate_chunk_size(m.chunk_size, m_object_id, *verifier, m_ctx->transport->max_message_size(),
                                         &error)) {
        return true;
    }
    LOG_ERROR("DL: Manifest for " + m_object_id + " cannot be carried: " + error);
    auto buf = buffer();
    if (buf) buf->abandon(TransferErrorKind::FORMAT_ERROR, "manifest chunk size does not fit the transport: " + error);
    finish_abandoned();
    return false;
}

void DownloadSession::on_chunk(const std::string& topic, const std::string& payload) {
    if (is_finished()) {
        return;
    }
    auto buf = buffer();
    if (!buf) {
        return;
    }

    Chunk chunk;
    std::string error;
    if (!chunk_codec::deserialize(payload, chunk, &error)) {
        if (m_ctx->stats) m_ctx->stats->malformed_frames++;
        LOG_WARN("DL: Malformed chunk frame on " + topic + ": " + error);
        return;
    }

    const InsertResult r = buf->insert(chunk);
    switch (r) {
        case InsertResult::ACCEPTED:
            if (m_ctx->stats) {
                m_ctx->stats->chunks_received++;
                m_ctx->stats->bytes_downloaded += chunk.payload.size();
            }
            break;
        case InsertResult::COMPLETED:
            if (m_ctx->stats) {
                m_ctx->stats->chunks_received++;
                m_ctx->stats->bytes_downloaded += chunk.payload.size();
            }
            finish_complete();
            break;
        case InsertResult::CORRUPTED:
            finish_abandoned();
            break;
        case InsertResult::DUPLICATE:
            if (m_ctx->stats) m_ctx->stats->duplicate_chunks++;
            break;
        case InsertResult::DIGEST_MISMATCH:
            if (m_ctx->stats) m_ctx->stats->digest_mismatches++;
            LOG_WARN("DL: Chunk " + std::to_string(chunk.index) + " of " + m_object_id +
                     " failed its digest, will re-request");
            break;
        case InsertResult::NOT_READY:
            // Dropped. Requested again once the manifest is in.
            break;
        case InsertResult::OUT_OF_RANGE:
        case InsertResult::WRONG_OBJECT:
            LOG_WARN("DL: Chunk " + std::to_string(chunk.index) + " on " + topic + " rejected: " +
                     insert_result_to_string(r));
            break;
        case InsertResult::CLOSED:
            break;
    }
}

// ============================================================================
// RETRANSMISSION / TIMEOUTS
// ============================================================================

void DownloadSession::on_tick() {
    if (is_finished()) {
        return;
    }
    auto buf = buffer();
    if (!buf) {
        return;
    }

    if (!buf->has_manifest()) {
        const int stalled = ++m_stalled_rounds;
        if (stalled > m_options.max_retransmit_rounds) {
            buf->abandon(TransferErrorKind::TIMEOUT_ERROR,
                         "no manifest after " + std::to_string(m_options.max_retransmit_rounds) + " request round(s)");
            finish_abandoned();
            return;
        }
        query_manifest();
        return;
    }

    const uint32_t received = buf->received_count();
    if (received != m_last_received.exchange(received)) {
        m_stalled_rounds = 0;
    } else {
        const int stalled = ++m_stalled_rounds;
        if (stalled > m_options.max_retransmit_rounds) {
            buf->abandon(TransferErrorKind::TIMEOUT_ERROR,
                         std::to_string(m_options.max_retransmit_rounds) + " retransmission round(s) without progress");
            finish_abandoned();
            return;
        }
    }

    const auto missing = buf->missing_indices();
    if (!missing.empty()) {
        request(false, missing);
    }
}

void DownloadSession::on_deadline() {
    if (is_finished()) {
        return;
    }
    auto buf = buffer();
    if (!buf) {
        return;
    }
    std::string reason = "download exceeded " + std::to_string(m_options.download_timeout_ms) + " ms";
    if (!buf->has_manifest()) {
        reason += " without a manifest";
    }
    buf->abandon(TransferErrorKind::TIMEOUT_ERROR, reason);
    finish_abandoned();
}

bool DownloadSession::request(bool manifest, const std::vector<uint32_t>& indices) {
    if (is_finished()) {
        return false;
    }

    RetransmitRequest req;
    req.object_id = m_object_id;
    req.manifest = manifest;
    req.indices = indices;

    const std::string topic = m_ctx->topics.retransmit_topic(m_object_id);
    for (const auto& part : transfer_messages::split_request(req, MAX_INDICES_PER_REQUEST)) {
        std::string error;
        if (!m_ctx->transport->publish(topic, transfer_messages::encode_retransmit(part), &error)) {
            auto buf = buffer();
            if (!buf) {
                fail(TransferErrorKind::TRANSPORT_ERROR, "retransmit request failed: " + error);
                return false;
            }
            buf->abandon(TransferErrorKind::TRANSPORT_ERROR, "retransmit request failed: " + error);
            finish_abandoned();
            return false;
        }
    }

    m_requests_sent++;
    if (m_ctx->stats) m_ctx->stats->retransmit_requests_sent++;
    LOG_DEBUG("DL: Requested " + std::string(manifest ? "manifest" : "") +
              (manifest && !indices.empty() ? " + " : "") +
              (indices.empty() ? "" : std::to_string(indices.size()) + " chunk(s)") + " for " + m_object_id);
    return true;
}

void DownloadSession::finish_complete() {
    auto buf = buffer();
    if (!buf || m_completing.exchange(true)) {
        // take_data() hands the bytes to one caller only
        return;
    }

    TransferResult result;
    result.success = true;
    result.manifest = buf->manifest();
    result.chunks_transferred = buf->received_count();
    result.retransmit_rounds = m_requests_sent.load();
    result.data = buf->take_data();

    if (m_options.send_ack) {
        TransferAck ack;
        ack.object_id = m_object_id;
        ack.object_digest = result.manifest.object_digest;
        std::string error;
        if (!m_ctx->transport->publish(m_ctx->topics.ack_topic(m_object_id), transfer_messages::encode_ack(ack),
                                       &error)) {
            // the object is already verified; a lost ack only delays the source
            LOG_WARN("DL: Ack for " + m_object_id + " not published: " + error);
        }
    }
    resolve(std::move(result));
}

void DownloadSession::finish_abandoned() {
    auto buf = buffer();
    if (!buf) {
        return;
    }
    // abandon() is a no-op once the last chunk got in first
    if (buf->state() == ReassemblyState::COMPLETE) {
        finish_complete();
        return;
    }
    const TransferError err = buf->error();
    fail(err.kind, err.message, err.missing_indices);
}

void DownloadSession::cancel() {
    auto buf = buffer();
    std::vector<uint32_t> missing;
    if (buf) {
        missing = buf->missing_indices();
        buf->abandon(TransferErrorKind::CANCELLED, "download cancelled");
    }
    fail(TransferErrorKind::CANCELLED, "download cancelled", missing);
}

void DownloadSession::release_resources() {
    SubscriptionId manifest_sub = 0;
    SubscriptionId chunk_sub = 0;
    TimerId tick = 0;
    TimerId deadline = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_released) return;
        m_released = true;
        std::swap(manifest_sub, m_manifest_sub);
        std::swap(chunk_sub, m_chunk_sub);
        std::swap(tick, m_tick_timer);
        std::swap(deadline, m_deadline_timer);
    }
    if (manifest_sub != 0) m_ctx->transport->unsubscribe(manifest_sub);
    if (chunk_sub != 0) m_ctx->transport->unsubscribe(chunk_sub);
    if (tick != 0) m_ctx->timers->cancelTimer(tick);
    if (deadline != 0) m_ctx->timers->cancelTimer(deadline);
}

} // namespace litecdn
