#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>

using json = nlohmann::json;

/**
 * Process-wide configuration backed by a JSON document.
 *
 * Every getter falls back to the built-in default when the key is missing or has
 * the wrong type, so an empty document is a valid configuration.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);
    bool saveConfig(const std::string& config_path) const;

    // Drops every loaded value; getters return defaults afterwards.
    void reset();

    // Creates intermediate objects as needed. Fails on an empty path or when a
    // non-object value sits on the way.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);
    bool eraseValueAtPath(const std::vector<std::string>& path);

    json snapshot() const;

    // Transfer
    std::string getResourceRoot() const;
    uint32_t getChunkSize() const;
    std::string getDigestAlgorithm() const;
    int getRetransmitIntervalMs() const;
    int getMaxRetransmitRounds() const;
    int getDownloadTimeoutMs() const;
    bool isAwaitAckEnabled() const;
    int getAckTimeoutMs() const;
    bool isParallelPublishEnabled() const;
    int getWorkerThreads() const;
    bool isSendAckEnabled() const;

    // Broker
    std::string getBrokerHost() const;
    int getBrokerPort() const;
    size_t getMaxMessageSize() const;
    std::string getStoreDir() const;
    int getConnectTimeoutMs() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(const char* section, const char* key, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
