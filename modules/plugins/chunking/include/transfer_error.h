#ifndef LITECDN_TRANSFER_ERROR_H
#define LITECDN_TRANSFER_ERROR_H

#include <cstdint>
#include <string>
#include <vector>

namespace litecdn {

enum class TransferErrorKind {
    NONE = 0,
    FORMAT_ERROR,        // malformed frame/manifest, or invalid parameters
    DIGEST_MISMATCH,     // a chunk failed its own digest
    CORRUPTION_ERROR,    // every chunk present but the object digest is wrong
    TIMEOUT_ERROR,       // retry budget or caller deadline exhausted
    TRANSPORT_ERROR,     // the pub/sub layer refused or failed an operation
    CANCELLED,           // caller withdrew interest
    INVALID_ARGUMENT,    // bad object id, unknown algorithm, zero chunk size
    BUSY,                // same object already in flight in this direction
};

inline const char* transfer_error_kind_to_string(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::NONE: return "None";
        case TransferErrorKind::FORMAT_ERROR: return "FormatError";
        case TransferErrorKind::DIGEST_MISMATCH: return "DigestMismatch";
        case TransferErrorKind::CORRUPTION_ERROR: return "CorruptionError";
        case TransferErrorKind::TIMEOUT_ERROR: return "TimeoutError";
        case TransferErrorKind::TRANSPORT_ERROR: return "TransportError";
        case TransferErrorKind::CANCELLED: return "Cancelled";
        case TransferErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
        case TransferErrorKind::BUSY: return "Busy";
    }
    return "Unknown";
}

struct TransferError {
    TransferErrorKind kind = TransferErrorKind::NONE;
    std::string message;
    std::vector<uint32_t> missing_indices;   // set for TIMEOUT_ERROR

    bool ok() const { return kind == TransferErrorKind::NONE; }

    std::string to_string() const {
        std::string s = transfer_error_kind_to_string(kind);
        if (!message.empty()) {
            s += ": " + message;
        }
        if (!missing_indices.empty()) {
            s += " (missing " + std::to_string(missing_indices.size()) + " chunk(s))";
        }
        return s;
    }
};

} // namespace litecdn

#endif // LITECDN_TRANSFER_ERROR_H
