#ifndef LITECDN_REASSEMBLY_BUFFER_H
#define LITECDN_REASSEMBLY_BUFFER_H

#include "chunk_codec.h"
#include "digest_registry.h"
#include "object_manifest.h"
#include "transfer_error.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

enum class ReassemblyState {
    AWAITING_MANIFEST,
    ACCUMULATING,
    COMPLETE,
    ABANDONED,
};

const char* reassembly_state_to_string(ReassemblyState state);

enum class InsertResult {
    ACCEPTED,         // slot filled, object still incomplete
    COMPLETED,        // slot filled and the object verified complete
    CORRUPTED,        // slot filled, object complete, but the object digest is wrong
    DUPLICATE,        // slot already present, no-op
    DIGEST_MISMATCH,  // payload does not match the manifest digest, dropped
    OUT_OF_RANGE,     // index/count/length disagree with the manifest, dropped
    WRONG_OBJECT,     // different object_id, dropped
    NOT_READY,        // no manifest yet, dropped
    CLOSED,           // buffer already COMPLETE or ABANDONED
};

const char* insert_result_to_string(InsertResult result);

/**
 * Destination-side state for one object.
 *
 * AWAITING_MANIFEST -> ACCUMULATING -> COMPLETE | ABANDONED. No transition goes back
 * and terminal states ignore all input. The object is written in place into a
 * buffer of total_size bytes, so completion needs no extra copy.
 *
 * Thread-safe: insert() may race with itself and with every other member.
 */
class ReassemblyBuffer {
public:
    explicit ReassemblyBuffer(std::string object_id);

    ReassemblyBuffer(const ReassemblyBuffer&) = delete;
    ReassemblyBuffer& operator=(const ReassemblyBuffer&) = delete;

    // Allocates the slots. A second, identical manifest is accepted as a no-op; a
    // different one is rejected. A zero-chunk manifest completes immediately.
    bool apply_manifest(const ObjectManifest& manifest, const DigestRegistry& registry, std::string* error);

    InsertResult insert(const Chunk& chunk);

    // Moves the buffer to ABANDONED (no-op once terminal).
    void abandon(TransferErrorKind kind, const std::string& reason);

    ReassemblyState state() const;
    bool has_manifest() const;
    bool is_terminal() const;
    ObjectManifest manifest() const;
    const std::string& object_id() const { return m_object_id; }

    uint32_t chunk_count() const;
    uint32_t received_count() const;
    std::vector<uint32_t> missing_indices() const;
    bool is_present(uint32_t index) const;

    uint64_t duplicates() const;
    uint64_t digest_mismatches() const;
    uint64_t rejected() const;

    TransferError error() const;

    // COMPLETE only: hands the object over. Later calls return empty bytes.
    std::vector<uint8_t> take_data();

private:
    // Caller holds m_mutex.
    InsertResult complete_locked();
    void abandon_locked(TransferErrorKind kind, const std::string& reason);

    const std::string m_object_id;

    mutable std::mutex m_mutex;
    ReassemblyState m_state;
    ObjectManifest m_manifest;
    std::shared_ptr<const IntegrityVerifier> m_verifier;
    std::vector<uint8_t> m_data;
    std::vector<bool> m_present;
    uint32_t m_received_count;
    uint64_t m_duplicates;
    uint64_t m_digest_mismatches;
    uint64_t m_rejected;
    TransferError m_error;
};

} // namespace litecdn

#endif // LITECDN_REASSEMBLY_BUFFER_H
