#ifndef LITECDN_TRANSFER_TYPES_H
#define LITECDN_TRANSFER_TYPES_H

#include "object_manifest.h"
#include "transfer_error.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

/**
 * TRANSFER TYPES AND COMMON DEFINITIONS
 *
 * Shared by UploadSession, DownloadSession and TransferManager.
 */

namespace litecdn {

// ============================================================================
// ENUMS
// ============================================================================

enum class TransferDirection {
    UPLOAD,         // source side: split and publish
    DOWNLOAD        // destination side: collect and reassemble
};

enum class SessionState {
    PENDING,        // created, start() not yet called
    PUBLISHING,     // upload: manifest/chunks being handed to the transport
    AWAITING_ACK,   // upload: serving retransmissions until acknowledged
    RECEIVING,      // download: collecting manifest and chunks
    COMPLETED,      // resolved successfully
    FAILED,         // resolved with an error
    CANCELLED       // resolved by cancel()
};

const char* session_state_to_string(SessionState state);

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;          // 1 MiB
constexpr int DEFAULT_RETRANSMIT_INTERVAL_MS = 500;
constexpr int DEFAULT_MAX_RETRANSMIT_ROUNDS = 8;             // consecutive rounds without progress
constexpr int DEFAULT_DOWNLOAD_TIMEOUT_MS = 60000;
constexpr int DEFAULT_ACK_TIMEOUT_MS = 10000;
constexpr size_t MAX_INDICES_PER_REQUEST = 4096;             // larger requests are split

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * Per-transfer knobs. from_config() fills them from ConfigManager.
 */
struct TransferOptions {
    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::string digest_algorithm = "sha256";
    std::string file_name;                  // upload: recorded in the manifest

    int retransmit_interval_ms = DEFAULT_RETRANSMIT_INTERVAL_MS;
    int max_retransmit_rounds = DEFAULT_MAX_RETRANSMIT_ROUNDS;
    int download_timeout_ms = DEFAULT_DOWNLOAD_TIMEOUT_MS;   // <= 0 disables the deadline
    bool send_ack = true;                   // download: acknowledge on completion

    bool await_ack = false;                 // upload: stay alive until acknowledged
    int ack_timeout_ms = DEFAULT_ACK_TIMEOUT_MS;
    bool parallel_publish = false;          // upload: spread publishes over the worker pool

    static TransferOptions from_config();
};

struct TransferResult {
    bool success = false;
    std::string object_id;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    std::vector<uint8_t> data;              // download only
    ObjectManifest manifest;
    TransferError error;

    uint32_t chunks_transferred = 0;        // published (upload) / accepted (download)
    uint32_t retransmit_rounds = 0;         // requests sent (download) / served (upload)
    uint64_t elapsed_ms = 0;
};

using TransferCallback = std::function<void(const TransferResult&)>;

/**
 * Counters shared between the manager and its sessions.
 */
struct TransferStatistics {
    std::atomic<uint64_t> uploads_started{0};
    std::atomic<uint64_t> uploads_completed{0};
    std::atomic<uint64_t> uploads_failed{0};
    std::atomic<uint64_t> downloads_started{0};
    std::atomic<uint64_t> downloads_completed{0};
    std::atomic<uint64_t> downloads_failed{0};
    std::atomic<uint64_t> chunks_published{0};
    std::atomic<uint64_t> chunks_received{0};
    std::atomic<uint64_t> duplicate_chunks{0};
    std::atomic<uint64_t> digest_mismatches{0};
    std::atomic<uint64_t> malformed_frames{0};
    std::atomic<uint64_t> retransmit_requests_sent{0};
    std::atomic<uint64_t> retransmit_requests_served{0};
    std::atomic<uint64_t> bytes_uploaded{0};
    std::atomic<uint64_t> bytes_downloaded{0};

    std::map<std::string, double> snapshot() const;
    void reset();
};

} // namespace litecdn

#endif // LITECDN_TRANSFER_TYPES_H
