#include "transfer_types.h"
#include "config_manager.h"

namespace litecdn {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "PENDING";
        case SessionState::PUBLISHING: return "PUBLISHING";
        case SessionState::AWAITING_ACK: return "AWAITING_ACK";
        case SessionState::RECEIVING: return "RECEIVING";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

TransferOptions TransferOptions::from_config() {
    const auto& cfg = ConfigManager::getInstance();
    TransferOptions o;
    o.chunk_size = cfg.getChunkSize();
    o.digest_algorithm = cfg.getDigestAlgorithm();
    o.retransmit_interval_ms = cfg.getRetransmitIntervalMs();
    o.max_retransmit_rounds = cfg.getMaxRetransmitRounds();
    o.download_timeout_ms = cfg.getDownloadTimeoutMs();
    o.send_ack = cfg.isSendAckEnabled();
    o.await_ack = cfg.isAwaitAckEnabled();
    o.ack_timeout_ms = cfg.getAckTimeoutMs();
    o.parallel_publish = cfg.isParallelPublishEnabled();
    return o;
}

std::map<std::string, double> TransferStatistics::snapshot() const {
    std::map<std::string, double> stats;
    stats["uploads_started"] = static_cast<double>(uploads_started.load());
    stats["uploads_completed"] = static_cast<double>(uploads_completed.load());
    stats["uploads_failed"] = static_cast<double>(uploads_failed.load());
    stats["downloads_started"] = static_cast<double>(downloads_started.load());
    stats["downloads_completed"] = static_cast<double>(downloads_completed.load());
    stats["downloads_failed"] = static_cast<double>(downloads_failed.load());
    stats["chunks_published"] = static_cast<double>(chunks_published.load());
    stats["chunks_received"] = static_cast<double>(chunks_received.load());
    stats["duplicate_chunks"] = static_cast<double>(duplicate_chunks.load());
    stats["digest_mismatches"] = static_cast<double>(digest_mismatches.load());
    stats["malformed_frames"] = static_cast<double>(malformed_frames.load());
    stats["retransmit_requests_sent"] = static_cast<double>(retransmit_requests_sent.load());
    stats["retransmit_requests_served"] = static_cast<double>(retransmit_requests_served.load());
    stats["bytes_uploaded"] = static_cast<double>(bytes_uploaded.load());
    stats["bytes_downloaded"] = static_cast<double>(bytes_downloaded.load());
    return stats;
}

void TransferStatistics::reset() {
    uploads_started = 0;
    uploads_completed = 0;
    uploads_failed = 0;
    downloads_started = 0;
    downloads_completed = 0;
    downloads_failed = 0;
    chunks_published = 0;
    chunks_received = 0;
    duplicate_chunks = 0;
    digest_mismatches = 0;
    malformed_frames = 0;
    retransmit_requests_sent = 0;
    retransmit_requests_served = 0;
    bytes_uploaded = 0;
    bytes_downloaded = 0;
}

} // namespace litecdn
