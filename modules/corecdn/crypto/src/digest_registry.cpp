#include "digest_registry.h"
#include "logger.h"

#include <sodium.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace litecdn {

// ============================================================================
// CRC32
// ============================================================================

namespace {

struct Crc32Table {
    uint32_t entries[256];

    Crc32Table() {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for (int j = 0; j < 8; j++) {
                if (crc & 1) {
                    crc = (crc >> 1) ^ 0xEDB88320UL;
                } else {
                    crc >>= 1;
                }
            }
            entries[i] = crc;
        }
    }
};

const Crc32Table& crc32_table() {
    static const Crc32Table table;
    return table;
}

// ============================================================================
// BUILT-IN VERIFIERS
// ============================================================================

class Sha256Verifier : public IntegrityVerifier {
public:
    const std::string& name() const override { return m_name; }
    size_t digest_size() const override { return crypto_hash_sha256_BYTES; }

    Digest compute(const uint8_t* data, size_t len) const override {
        Digest out(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256(out.data(), data, len) != 0) {
            LOG_ERROR("DIGEST: crypto_hash_sha256 failed");
            return {};
        }
        return out;
    }

private:
    std::string m_name = "sha256";
};

class Blake2bVerifier : public IntegrityVerifier {
public:
    const std::string& name() const override { return m_name; }
    size_t digest_size() const override { return crypto_generichash_BYTES; }

    Digest compute(const uint8_t* data, size_t len) const override {
        Digest out(crypto_generichash_BYTES);
        if (crypto_generichash(out.data(), out.size(), data, len, nullptr, 0) != 0) {
            LOG_ERROR("DIGEST: crypto_generichash failed");
            return {};
        }
        return out;
    }

private:
    std::string m_name = "blake2b";
};

class Sha3Verifier : public IntegrityVerifier {
public:
    const std::string& name() const override { return m_name; }
    size_t digest_size() const override { return 32; }

    Digest compute(const uint8_t* data, size_t len) const override {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr) {
            LOG_ERROR("DIGEST: EVP_MD_CTX_new failed");
            return {};
        }

        Digest out(EVP_MD_size(EVP_sha3_256()));
        unsigned int written = 0;
        const bool ok = EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr) == 1 &&
                        EVP_DigestUpdate(ctx, data, len) == 1 &&
                        EVP_DigestFinal_ex(ctx, out.data(), &written) == 1;
        EVP_MD_CTX_free(ctx);

        if (!ok || written != out.size()) {
            LOG_ERROR("DIGEST: sha3-256 digest failed");
            return {};
        }
        return out;
    }

private:
    std::string m_name = "sha3-256";
};

class Crc32Verifier : public IntegrityVerifier {
public:
    const std::string& name() const override { return m_name; }
    size_t digest_size() const override { return 4; }

    Digest compute(const uint8_t* data, size_t len) const override {
        const uint32_t crc = crc32(data, len);
        return Digest{static_cast<uint8_t>((crc >> 24) & 0xFF),
                      static_cast<uint8_t>((crc >> 16) & 0xFF),
                      static_cast<uint8_t>((crc >> 8) & 0xFF),
                      static_cast<uint8_t>(crc & 0xFF)};
    }

private:
    std::string m_name = "crc32";
};

} // namespace

uint32_t crc32(const uint8_t* data, size_t len) {
    const auto& table = crc32_table();
    uint32_t crc = 0xFFFFFFFFUL;
    for (size_t i = 0; i < len; ++i) {
        crc = (crc >> 8) ^ table.entries[(crc ^ data[i]) & 0xFF];
    }
    return crc ^ 0xFFFFFFFFUL;
}

// ============================================================================
// IntegrityVerifier
// ============================================================================

bool IntegrityVerifier::matches(const uint8_t* data, size_t len, const Digest& expected) const {
    const Digest actual = compute(data, len);
    if (actual.empty()) {
        return false;
    }
    return digests_equal(actual, expected);
}

// ============================================================================
// DigestRegistry
// ============================================================================

DigestRegistry::DigestRegistry() {
    if (sodium_init() < 0) {
        nativeLog("DIGEST: Failed to initialize libsodium");
        throw std::runtime_error("Libsodium init failed");
    }

    m_verifiers["sha256"] = std::make_shared<Sha256Verifier>();
    m_verifiers["blake2b"] = std::make_shared<Blake2bVerifier>();
    m_verifiers["sha3-256"] = std::make_shared<Sha3Verifier>();
    m_verifiers["crc32"] = std::make_shared<Crc32Verifier>();
}

std::shared_ptr<DigestRegistry> DigestRegistry::defaults() {
    static std::shared_ptr<DigestRegistry> instance = std::make_shared<DigestRegistry>();
    return instance;
}

bool DigestRegistry::register_verifier(std::shared_ptr<const IntegrityVerifier> verifier) {
    if (!verifier || verifier->name().empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_verifiers.count(verifier->name())) {
        LOG_WARN("DIGEST: Algorithm already registered: " + verifier->name());
        return false;
    }
    m_verifiers[verifier->name()] = std::move(verifier);
    return true;
}

std::shared_ptr<const IntegrityVerifier> DigestRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_verifiers.find(name);
    return it == m_verifiers.end() ? nullptr : it->second;
}

std::vector<std::string> DigestRegistry::names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_verifiers.size());
    for (const auto& [name, verifier] : m_verifiers) {
        result.push_back(name);
    }
    return result;
}

// ============================================================================
// HEX / COMPARISON
// ============================================================================

std::string to_hex(const Digest& digest) {
    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), digest.data(), digest.size());
    hex.resize(digest.size() * 2);
    return hex;
}

bool from_hex(const std::string& hex, Digest& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    Digest bin(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) != 0) {
        return false;
    }
    // sodium stops at the first non-hex character; require the whole string
    if (end != hex.data() + hex.size() || bin_len != bin.size()) {
        return false;
    }
    out = std::move(bin);
    return true;
}

bool digests_equal(const Digest& a, const Digest& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace litecdn
