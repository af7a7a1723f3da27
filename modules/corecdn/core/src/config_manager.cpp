#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <sstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_DEBUG("CONFIG: Failed to open config file: " + config_path);
        return false;
    }
    std::stringstream ss;
    ss << config_file.rdbuf();
    if (!loadFromString(ss.str())) {
        LOG_ERROR("CONFIG: Config loading failed for " + config_path);
        return false;
    }
    LOG_INFO("CONFIG: Configuration loaded from: " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    json parsed;
    try {
        // allow comments, like hand-edited config.json files tend to have
        parsed = json::parse(text, nullptr, true, true);
    } catch (const json::parse_error& e) {
        LOG_ERROR(std::string("CONFIG: Parse error: ") + e.what());
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("CONFIG: Top-level value must be an object");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = std::move(parsed);
    return true;
}

bool ConfigManager::saveConfig(const std::string& config_path) const {
    std::ofstream out(config_path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("CONFIG: Cannot write " + config_path);
        return false;
    }
    out << snapshot().dump(4) << std::endl;
    return static_cast<bool>(out);
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& next = (*node)[path[i]];
        if (next.is_null()) {
            next = json::object();
        } else if (!next.is_object()) {
            return false;
        }
        node = &next;
    }
    (*node)[path.back()] = value;
    return true;
}

bool ConfigManager::eraseValueAtPath(const std::vector<std::string>& path) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        auto it = node->find(path[i]);
        if (it == node->end() || !it->is_object()) {
            return false;
        }
        node = &(*it);
    }
    return node->erase(path.back()) > 0;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

template <typename T>
T ConfigManager::valueAt(const char* section, const char* key, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sec = m_config.find(section);
    if (sec == m_config.end() || !sec->is_object()) {
        return fallback;
    }
    try {
        return sec->value(key, fallback);
    } catch (const json::type_error& e) {
        LOG_WARN(std::string("CONFIG: Wrong type for ") + section + "." + key + ", using default (" + e.what() + ")");
        return fallback;
    }
}

std::string ConfigManager::getResourceRoot() const {
    return valueAt<std::string>("transfer", "resource_root", "/litecdn");
}

uint32_t ConfigManager::getChunkSize() const {
    return valueAt<uint32_t>("transfer", "chunk_size", 1024u * 1024u);
}

std::string ConfigManager::getDigestAlgorithm() const {
    return valueAt<std::string>("transfer", "digest_algorithm", "sha256");
}

int ConfigManager::getRetransmitIntervalMs() const {
    return valueAt<int>("transfer", "retransmit_interval_ms", 500);
}

int ConfigManager::getMaxRetransmitRounds() const {
    return valueAt<int>("transfer", "max_retransmit_rounds", 8);
}

int ConfigManager::getDownloadTimeoutMs() const {
    return valueAt<int>("transfer", "download_timeout_ms", 60000);
}

bool ConfigManager::isAwaitAckEnabled() const {
    return valueAt<bool>("transfer", "await_ack", false);
}

int ConfigManager::getAckTimeoutMs() const {
    return valueAt<int>("transfer", "ack_timeout_ms", 10000);
}

bool ConfigManager::isParallelPublishEnabled() const {
    return valueAt<bool>("transfer", "parallel_publish", false);
}

int ConfigManager::getWorkerThreads() const {
    return valueAt<int>("transfer", "worker_threads", 4);
}

bool ConfigManager::isSendAckEnabled() const {
    return valueAt<bool>("transfer", "send_ack", true);
}

std::string ConfigManager::getBrokerHost() const {
    return valueAt<std::string>("broker", "host", "127.0.0.1");
}

int ConfigManager::getBrokerPort() const {
    return valueAt<int>("broker", "port", 7447);
}

size_t ConfigManager::getMaxMessageSize() const {
    return valueAt<size_t>("broker", "max_message_size", 16u * 1024u * 1024u);
}

std::string ConfigManager::getStoreDir() const {
    return valueAt<std::string>("broker", "store_dir", "");
}

int ConfigManager::getConnectTimeoutMs() const {
    return valueAt<int>("broker", "connect_timeout_ms", 3000);
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>("logging", "async", false);
}
