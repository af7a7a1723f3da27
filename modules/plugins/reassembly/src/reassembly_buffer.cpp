#include "reassembly_buffer.h"
#include "logger.h"

#include <cstring>
#include <new>
#include <stdexcept>

namespace litecdn {

const char* reassembly_state_to_string(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::AWAITING_MANIFEST: return "AWAITING_MANIFEST";
        case ReassemblyState::ACCUMULATING: return "ACCUMULATING";
        case ReassemblyState::COMPLETE: return "COMPLETE";
        case ReassemblyState::ABANDONED: return "ABANDONED";
    }
    return "UNKNOWN";
}

const char* insert_result_to_string(InsertResult result) {
    switch (result) {
        case InsertResult::ACCEPTED: return "ACCEPTED";
        case InsertResult::COMPLETED: return "COMPLETED";
        case InsertResult::CORRUPTED: return "CORRUPTED";
        case InsertResult::DUPLICATE: return "DUPLICATE";
        case InsertResult::DIGEST_MISMATCH: return "DIGEST_MISMATCH";
        case InsertResult::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case InsertResult::WRONG_OBJECT: return "WRONG_OBJECT";
        case InsertResult::NOT_READY: return "NOT_READY";
        case InsertResult::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

ReassemblyBuffer::ReassemblyBuffer(std::string object_id)
    : m_object_id(std::move(object_id)),
      m_state(ReassemblyState::AWAITING_MANIFEST),
      m_received_count(0),
      m_duplicates(0),
      m_digest_mismatches(0),
      m_rejected(0) {}

bool ReassemblyBuffer::apply_manifest(const ObjectManifest& manifest, const DigestRegistry& registry, std::string* error) {
    auto verifier = registry.find(manifest.digest_algorithm);
    if (!verifier) {
        if (error) *error = "unknown digest algorithm '" + manifest.digest_algorithm + "'";
        return false;
    }
    if (!manifest::validate(manifest, verifier.get(), error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (manifest.object_id != m_object_id) {
        if (error) *error = "manifest is for '" + manifest.object_id + "', expected '" + m_object_id + "'";
        return false;
    }
    if (m_state != ReassemblyState::AWAITING_MANIFEST) {
        if (m_state == ReassemblyState::ABANDONED) {
            if (error) *error = "reassembly already abandoned";
            return false;
        }
        if (manifest != m_manifest) {
            if (error) *error = "conflicting manifest for '" + m_object_id + "'";
            LOG_WARN("RB: Conflicting manifest ignored for " + m_object_id);
            return false;
        }
        return true;
    }

    m_manifest = manifest;
    m_verifier = std::move(verifier);
    m_present.assign(manifest.chunk_count, false);
    m_received_count = 0;
    try {
        m_data.assign(static_cast<size_t>(manifest.total_size), 0);
    } catch (const std::bad_alloc&) {
        abandon_locked(TransferErrorKind::FORMAT_ERROR,
                       "cannot allocate " + std::to_string(manifest.total_size) + " bytes");
        if (error) *error = m_error.message;
        return false;
    } catch (const std::length_error&) {
        abandon_locked(TransferErrorKind::FORMAT_ERROR,
                       "object size " + std::to_string(manifest.total_size) + " not addressable");
        if (error) *error = m_error.message;
        return false;
    }
    m_state = ReassemblyState::ACCUMULATING;

    LOG_DEBUG("RB: " + m_object_id + " AWAITING_MANIFEST --(manifest)--> ACCUMULATING, " +
              std::to_string(manifest.chunk_count) + " chunk(s), " + std::to_string(manifest.total_size) + " bytes");

    if (manifest.chunk_count == 0) {
        complete_locked();
    }
    return true;
}

InsertResult ReassemblyBuffer::insert(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state == ReassemblyState::COMPLETE || m_state == ReassemblyState::ABANDONED) {
        return InsertResult::CLOSED;
    }
    if (chunk.object_id != m_object_id) {
        m_rejected++;
        return InsertResult::WRONG_OBJECT;
    }
    if (m_state == ReassemblyState::AWAITING_MANIFEST) {
        m_rejected++;
        return InsertResult::NOT_READY;
    }

    // duplicate check first: a late copy of a present slot is never re-hashed
    if (chunk.index < m_manifest.chunk_count && chunk.chunk_count == m_manifest.chunk_count &&
        m_present[chunk.index]) {
        m_duplicates++;
        return InsertResult::DUPLICATE;
    }

    switch (manifest::check_chunk(m_manifest, chunk, *m_verifier)) {
        case ChunkCheck::OK:
            break;
        case ChunkCheck::WRONG_OBJECT:
            m_rejected++;
            return InsertResult::WRONG_OBJECT;
        case ChunkCheck::OUT_OF_RANGE:
        case ChunkCheck::LENGTH_MISMATCH:
            m_rejected++;
            LOG_WARN("RB: Chunk " + std::to_string(chunk.index) + "/" + std::to_string(chunk.chunk_count) +
                     " does not fit manifest of " + m_object_id);
            return InsertResult::OUT_OF_RANGE;
        case ChunkCheck::ALGORITHM_MISMATCH:
        case ChunkCheck::DIGEST_MISMATCH:
            m_digest_mismatches++;
            LOG_WARN("RB: Digest mismatch for chunk " + std::to_string(chunk.index) + " of " + m_object_id);
            return InsertResult::DIGEST_MISMATCH;
    }

    if (!chunk.payload.empty()) {
        std::memcpy(m_data.data() + m_manifest.chunk_offset(chunk.index), chunk.payload.data(), chunk.payload.size());
    }
    m_present[chunk.index] = true;
    m_received_count++;

    if (m_received_count == m_manifest.chunk_count) {
        return complete_locked();
    }
    return InsertResult::ACCEPTED;
}

InsertResult ReassemblyBuffer::complete_locked() {
    if (!manifest::verify_complete(m_manifest, m_data, *m_verifier)) {
        abandon_locked(TransferErrorKind::CORRUPTION_ERROR,
                       "object digest mismatch after all " + std::to_string(m_manifest.chunk_count) +
                       " chunk(s) verified");
        return InsertResult::CORRUPTED;
    }
    m_state = ReassemblyState::COMPLETE;
    LOG_DEBUG("RB: " + m_object_id + " ACCUMULATING --(last chunk)--> COMPLETE");
    return InsertResult::COMPLETED;
}

void ReassemblyBuffer::abandon(TransferErrorKind kind, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    abandon_locked(kind, reason);
}

void ReassemblyBuffer::abandon_locked(TransferErrorKind kind, const std::string& reason) {
    if (m_state == ReassemblyState::COMPLETE || m_state == ReassemblyState::ABANDONED) {
        return;
    }
    const ReassemblyState old_state = m_state;
    m_state = ReassemblyState::ABANDONED;
    m_error.kind = kind;
    m_error.message = reason;
    m_error.missing_indices.clear();
    for (uint32_t i = 0; i < m_present.size(); ++i) {
        if (!m_present[i]) m_error.missing_indices.push_back(i);
    }
    // release the object memory right away
    std::vector<uint8_t>().swap(m_data);

    LOG_INFO(std::string("RB: ") + m_object_id + " " + reassembly_state_to_string(old_state) + " --(" +
             transfer_error_kind_to_string(kind) + ")--> ABANDONED: " + reason);
}

ReassemblyState ReassemblyBuffer::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool ReassemblyBuffer::has_manifest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_verifier != nullptr;
}

bool ReassemblyBuffer::is_terminal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == ReassemblyState::COMPLETE || m_state == ReassemblyState::ABANDONED;
}

ObjectManifest ReassemblyBuffer::manifest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_manifest;
}

uint32_t ReassemblyBuffer::chunk_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_manifest.chunk_count;
}

uint32_t ReassemblyBuffer::received_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_received_count;
}

std::vector<uint32_t> ReassemblyBuffer::missing_indices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<uint32_t> missing;
    for (uint32_t i = 0; i < m_present.size(); ++i) {
        if (!m_present[i]) missing.push_back(i);
    }
    return missing;
}

bool ReassemblyBuffer::is_present(uint32_t index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return index < m_present.size() && m_present[index];
}

uint64_t ReassemblyBuffer::duplicates() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_duplicates;
}

uint64_t ReassemblyBuffer::digest_mismatches() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_digest_mismatches;
}

uint64_t ReassemblyBuffer::rejected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rejected;
}

TransferError ReassemblyBuffer::error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

std::vector<uint8_t> ReassemblyBuffer::take_data() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != ReassemblyState::COMPLETE) {
        return {};
    }
    return std::move(m_data);
}

} // namespace litecdn
