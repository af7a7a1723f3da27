#include "broker_client.h"
#include "broker_wire.h"
#include "logger.h"
#include "tcp_socket.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <vector>

namespace litecdn {

namespace {

constexpr int kPollIntervalMs = 200;
constexpr size_t kRecvBufferSize = 64 * 1024;
constexpr size_t kMaxTopicLength = 4096;

} // namespace

BrokerClient::BrokerClient(size_t max_message_size)
    : m_max_message_size(max_message_size), m_sock(-1), m_connected(false), m_stopping(false) {}

BrokerClient::~BrokerClient() {
    disconnect();
}

bool BrokerClient::connect(const std::string& host, int port, int timeout_ms, std::string* error) {
    if (m_connected || m_reader.joinable()) {
        if (error) *error = "already connected";
        return false;
    }

    m_sock = tcp_connect(host, port, timeout_ms, error);
    if (m_sock < 0) {
        LOG_WARN("TCP: Broker " + host + ":" + std::to_string(port) + " unreachable");
        return false;
    }
    m_network_id = host + ":" + std::to_string(port);
    m_stopping = false;
    m_connected = true;
    m_reader = std::thread(&BrokerClient::reader_loop, this);
    LOG_INFO("TCP: Connected to broker " + m_network_id);
    return true;
}

void BrokerClient::disconnect() {
    m_stopping = true;
    if (m_sock >= 0) {
        shutdown(m_sock, SHUT_RDWR);
    }
    if (m_reader.joinable()) {
        m_reader.join();
    }
    if (m_sock >= 0) {
        tcp_close(m_sock);
        m_sock = -1;
    }
    m_connected = false;
}

bool BrokerClient::send_frame(const std::string& bytes, std::string* error) {
    if (!m_connected) {
        if (error) *error = "not connected to a broker";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (!tcp_send_all(m_sock, bytes.data(), bytes.size(), error)) {
        m_connected = false;
        return false;
    }
    return true;
}

// ============================================================================
// PubSubTransport
// ============================================================================

bool BrokerClient::publish(const std::string& topic, const std::string& payload, std::string* error) {
    if (payload.size() > m_max_message_size) {
        if (error) *error = "payload of " + std::to_string(payload.size()) + " bytes exceeds the limit of " +
                            std::to_string(m_max_message_size);
        return false;
    }
    WireFrame frame;
    frame.type = FrameType::PUBLISH;
    frame.topic = topic;
    frame.payload = payload;
    return send_frame(broker_wire::encode(frame), error);
}

SubscriptionId BrokerClient::subscribe(const std::string& pattern, SampleCallback on_sample, std::string* error) {
    if (pattern.empty() || !on_sample) {
        if (error) *error = "empty pattern or callback";
        return 0;
    }

    SubscriptionId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_id++;
        m_subscriptions[id] = std::move(on_sample);
    }

    WireFrame frame;
    frame.type = FrameType::SUBSCRIBE;
    frame.id = id;
    frame.topic = pattern;
    if (!send_frame(broker_wire::encode(frame), error)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.erase(id);
        return 0;
    }
    return id;
}

void BrokerClient::unsubscribe(SubscriptionId id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_subscriptions.erase(id) == 0) {
            return;
        }
    }
    WireFrame frame;
    frame.type = FrameType::UNSUBSCRIBE;
    frame.id = id;
    std::string error;
    if (!send_frame(broker_wire::encode(frame), &error)) {
        // the server drops our subscriptions when the connection goes
        LOG_DEBUG("TCP: Unsubscribe " + std::to_string(id) + " not sent: " + error);
    }
}

bool BrokerClient::query(const std::string& selector,
                         SampleCallback on_reply,
                         QueryDoneCallback on_done,
                         std::string* error) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_id++;
        m_queries[id] = PendingQuery{std::move(on_reply), std::move(on_done)};
    }

    WireFrame frame;
    frame.type = FrameType::QUERY;
    frame.id = id;
    frame.topic = selector;
    if (!send_frame(broker_wire::encode(frame), error)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queries.erase(id);
        return false;
    }
    return true;
}

// ============================================================================
// READER
// ============================================================================

void BrokerClient::reader_loop() {
    const size_t max_body = broker_wire::kBodyOverhead + kMaxTopicLength + m_max_message_size;
    std::vector<char> buf(kRecvBufferSize);
    std::vector<uint8_t> receive_buffer;

    while (!m_stopping) {
        const int ready = tcp_wait_readable(m_sock, kPollIntervalMs);
        if (ready < 0) {
            LOG_WARN("TCP: select() failed on broker connection: " + std::string(strerror(errno)));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = recv(m_sock, buf.data(), buf.size(), 0);
        if (n == 0) {
            if (!m_stopping) LOG_WARN("TCP: Broker " + m_network_id + " closed the connection");
            break;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (!m_stopping) LOG_WARN("TCP: recv() from broker failed: " + std::string(strerror(errno)));
            break;
        }

        receive_buffer.insert(receive_buffer.end(), buf.data(), buf.data() + n);
        std::vector<WireFrame> frames;
        std::string error;
        if (!broker_wire::extract(receive_buffer, max_body, frames, &error)) {
            LOG_ERROR("TCP: Malformed stream from broker: " + error);
            break;
        }

        for (const auto& frame : frames) {
            switch (frame.type) {
                case FrameType::SAMPLE: {
                    SampleCallback cb;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        auto it = m_subscriptions.find(frame.id);
                        if (it != m_subscriptions.end()) cb = it->second;
                    }
                    if (cb) cb(frame.topic, frame.payload);
                    break;
                }
                case FrameType::REPLY: {
                    SampleCallback cb;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        auto it = m_queries.find(frame.id);
                        if (it != m_queries.end()) cb = it->second.on_reply;
                    }
                    if (cb) cb(frame.topic, frame.payload);
                    break;
                }
                case FrameType::REPLY_END: {
                    QueryDoneCallback done;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        auto it = m_queries.find(frame.id);
                        if (it != m_queries.end()) {
                            done = std::move(it->second.on_done);
                            m_queries.erase(it);
                        }
                    }
                    if (done) done();
                    break;
                }
                case FrameType::ERROR:
                    LOG_WARN("TCP: Broker reported: " + frame.payload);
                    break;
                default:
                    LOG_WARN("TCP: Unexpected " + std::string(frame_type_to_string(frame.type)) + " frame from broker");
                    break;
            }
        }
    }

    m_connected = false;
    fail_pending_queries();
}

void BrokerClient::fail_pending_queries() {
    std::map<uint64_t, PendingQuery> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending.swap(m_queries);
    }
    for (auto& kv : pending) {
        if (kv.second.on_done) kv.second.on_done();
    }
}

} // namespace litecdn
