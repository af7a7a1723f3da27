#ifndef LITECDN_DIGEST_REGISTRY_H
#define LITECDN_DIGEST_REGISTRY_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

using Digest = std::vector<uint8_t>;

/**
 * Digest function for one algorithm.
 *
 * compute() returns an empty Digest when the backend fails; matches() treats that
 * as a mismatch, so a broken backend can never make data look valid.
 */
class IntegrityVerifier {
public:
    virtual ~IntegrityVerifier() = default;

    virtual const std::string& name() const = 0;
    virtual size_t digest_size() const = 0;
    virtual Digest compute(const uint8_t* data, size_t len) const = 0;

    Digest compute(const std::vector<uint8_t>& data) const {
        return compute(data.data(), data.size());
    }

    // Constant-time comparison of compute(data) against expected.
    bool matches(const uint8_t* data, size_t len, const Digest& expected) const;
    bool matches(const std::vector<uint8_t>& data, const Digest& expected) const {
        return matches(data.data(), data.size(), expected);
    }
};

/**
 * Maps algorithm names to verifiers.
 *
 * Built-ins: "sha256", "blake2b" (libsodium, 32-byte output), "sha3-256" (OpenSSL)
 * and "crc32". crc32 only catches accidental damage and must not be used where a
 * peer could forge chunks.
 *
 * Throws std::runtime_error from the constructor if libsodium cannot initialize.
 */
class DigestRegistry {
public:
    DigestRegistry();

    // Shared instance with the built-ins, for callers that do not need their own.
    static std::shared_ptr<DigestRegistry> defaults();

    // Fails if an algorithm with the same name is already registered.
    bool register_verifier(std::shared_ptr<const IntegrityVerifier> verifier);

    // nullptr for unknown names
    std::shared_ptr<const IntegrityVerifier> find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    std::vector<std::string> names() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const IntegrityVerifier>> m_verifiers;
};

// Lowercase hex helpers (libsodium backed).
std::string to_hex(const Digest& digest);
bool from_hex(const std::string& hex, Digest& out);

// Constant-time equality; different lengths compare unequal.
bool digests_equal(const Digest& a, const Digest& b);

// CRC-32 (IEEE 802.3), table driven.
uint32_t crc32(const uint8_t* data, size_t len);

} // namespace litecdn

#endif // LITECDN_DIGEST_REGISTRY_H
