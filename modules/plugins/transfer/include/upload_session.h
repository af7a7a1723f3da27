#ifndef LITECDN_UPLOAD_SESSION_H
#define LITECDN_UPLOAD_SESSION_H

#include "transfer_session.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

/**
 * Source side of one transfer.
 *
 * Validates the chunk size against the transport ceiling, builds the manifest,
 * publishes it and then every chunk. With await_ack the session stays alive,
 * re-publishing requested chunks, until the destination acknowledges the object
 * digest or ack_timeout_ms passes.
 *
 * Publish failures end the upload with TRANSPORT_ERROR; nothing is retried here.
 */
class UploadSession : public TransferSession, public std::enable_shared_from_this<UploadSession> {
public:
    UploadSession(std::string object_id,
                  std::vector<uint8_t> data,
                  TransferOptions options,
                  std::shared_ptr<SessionContext> ctx,
                  TransferCallback on_done);
    ~UploadSession() override;

    void start() override;
    void cancel() override;

    uint32_t chunk_count() const { return m_chunk_count.load(); }
    uint32_t chunks_published() const { return m_published.load(); }

private:
    bool prepare();
    bool subscribe_control();
    void publish_sequential();
    void publish_parallel();
    bool publish_frame(uint32_t index);
    void on_all_published();

    void on_retransmit_request(const std::string& payload);
    void on_ack(const std::string& payload);
    void on_ack_timeout();

    TransferResult success_result() const;
    void release_resources() override;

    std::vector<uint8_t> m_data;            // dropped once the frames are built
    ObjectManifest m_manifest;
    std::string m_manifest_payload;
    std::vector<std::string> m_frames;      // serialized chunks, kept for retransmission

    std::atomic<uint32_t> m_chunk_count{0};
    std::atomic<uint32_t> m_published{0};
    std::atomic<uint32_t> m_pending_parallel{0};
    std::atomic<uint32_t> m_requests_served{0};

    std::mutex m_mutex;                     // guards the handles below
    bool m_released = false;
    SubscriptionId m_ack_sub = 0;
    SubscriptionId m_retransmit_sub = 0;
    TimerId m_ack_timer = 0;
};

} // namespace litecdn

#endif // LITECDN_UPLOAD_SESSION_H
