#ifndef LITECDN_DOWNLOAD_SESSION_H
#define LITECDN_DOWNLOAD_SESSION_H

#include "reassembly_buffer.h"
#include "transfer_session.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

/**
 * Destination side of one transfer.
 *
 * Subscribes to the object's manifest and chunk topics, feeds a ReassemblyBuffer,
 * and every retransmit_interval_ms asks for exactly the chunks still missing.
 * After max_retransmit_rounds ticks in a row without a new chunk, or once
 * download_timeout_ms passes, the object is abandoned with TIMEOUT_ERROR and the
 * missing set is reported.
 */
class DownloadSession : public TransferSession, public std::enable_shared_from_this<DownloadSession> {
public:
    DownloadSession(std::string object_id,
                    TransferOptions options,
                    std::shared_ptr<SessionContext> ctx,
                    TransferCallback on_done);
    ~DownloadSession() override;

    void start() override;
    void cancel() override;

    // Snapshot for progress reporting; empty before the manifest arrives.
    std::vector<uint32_t> missing_indices() const;
    uint32_t received_count() const;

private:
    bool subscribe_topics();
    void start_timers();
    void query_manifest();

    void on_manifest(const std::string& payload);
    void on_chunk(const std::string& topic, const std::string& payload);
    void on_tick();
    void on_deadline();

    bool fits_transport(const ObjectManifest& m);
    bool request(bool manifest, const std::vector<uint32_t>& indices);
    void finish_complete();
    void finish_abandoned();

    std::shared_ptr<ReassemblyBuffer> buffer() const;
    void release_resources() override;

    mutable std::mutex m_mutex;             // guards everything below
    bool m_released = false;
    std::shared_ptr<ReassemblyBuffer> m_buffer;
    SubscriptionId m_manifest_sub = 0;
    SubscriptionId m_chunk_sub = 0;
    TimerId m_tick_timer = 0;
    TimerId m_deadline_timer = 0;

    std::atomic<uint32_t> m_last_received{0};
    std::atomic<int> m_stalled_rounds{0};
    std::atomic<uint32_t> m_requests_sent{0};
    std::atomic<bool> m_completing{false};
};

} // namespace litecdn

#endif // LITECDN_DOWNLOAD_SESSION_H
