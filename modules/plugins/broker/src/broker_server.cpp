#include "broker_server.h"
#include "broker_wire.h"
#include "config_manager.h"
#include "logger.h"
#include "tcp_socket.h"

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace litecdn {

namespace {

constexpr int kListenBacklog = 64;
constexpr int kPollIntervalMs = 200;
constexpr size_t kRecvBufferSize = 64 * 1024;
constexpr size_t kMaxTopicLength = 4096;

} // namespace

BrokerServer::Options BrokerServer::Options::from_config() {
    const auto& cfg = ConfigManager::getInstance();
    Options o;
    o.resource_root = cfg.getResourceRoot();
    o.store_dir = cfg.getStoreDir();
    o.max_message_size = cfg.getMaxMessageSize();
    return o;
}

class BrokerServer::Impl {
public:
    explicit Impl(Options options)
        : m_options(std::move(options)),
          m_store(std::make_shared<ChunkStore>(TopicScheme(m_options.resource_root), m_options.store_dir)),
          m_core(TopicScheme(m_options.resource_root), m_store),
          m_running(false),
          m_server_sock(-1),
          m_port(0) {}

    ~Impl() { stop(); }

    bool start(int port, std::string* error) {
        if (m_running) {
            if (error) *error = "already running";
            return false;
        }
        if (!m_store->load(error)) {
            return false;
        }

        int bound_port = 0;
        m_server_sock = tcp_listen(port, kListenBacklog, &bound_port, error);
        if (m_server_sock < 0) {
            return false;
        }
        m_port = bound_port;
        m_running = true;
        m_accept_thread = std::thread(&Impl::accept_loop, this);

        LOG_INFO("BROKER: Listening on port " + std::to_string(m_port) + ", root " + m_core.topics().root() +
                 (m_options.store_dir.empty() ? ", memory store" : ", store " + m_options.store_dir));
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) {
            return;
        }

        shutdown(m_server_sock, SHUT_RDWR);
        if (m_accept_thread.joinable()) m_accept_thread.join();
        close(m_server_sock);
        m_server_sock = -1;

        std::map<int, std::shared_ptr<Connection>> connections;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            connections.swap(m_connections);
        }
        for (auto& kv : connections) {
            shutdown(kv.second->sock, SHUT_RDWR);
        }
        for (auto& kv : connections) {
            reap(kv.second);
        }
        LOG_INFO("BROKER: Server stopped");
    }

    bool is_running() const { return m_running; }
    int port() const { return m_port; }

    size_t connection_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& kv : m_connections) {
            if (!kv.second->done) n++;
        }
        return n;
    }

    BrokerCore& core() { return m_core; }

private:
    struct Connection {
        int sock = -1;
        std::string network_id;
        std::thread reader;
        std::atomic<bool> done{false};

        std::mutex out_mutex;
        std::condition_variable out_cv;
        std::deque<std::string> outbox;
        size_t outbox_bytes = 0;
        bool closing = false;

        std::mutex subs_mutex;
        std::map<uint64_t, SubscriptionId> subs;   // client id -> core id
    };

    // ------------------------------------------------------------------------
    // accept
    // ------------------------------------------------------------------------

    void accept_loop() {
        while (m_running) {
            const int ready = tcp_wait_readable(m_server_sock, kPollIntervalMs);
            if (ready < 0) {
                if (m_running) LOG_ERROR("TCP: select() failed in accept loop: " + std::string(strerror(errno)));
                break;
            }
            reap_finished();
            if (ready == 0) {
                continue;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            const int client_sock = accept(m_server_sock, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_sock < 0) {
                if (m_running) LOG_WARN("TCP: accept() failed: " + std::string(strerror(errno)));
                continue;
            }

            char client_ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));

            auto conn = std::make_shared<Connection>();
            conn->sock = client_sock;
            conn->network_id = std::string(client_ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
            LOG_INFO("TCP: Accepted connection from " + conn->network_id);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_connections[client_sock] = conn;
            conn->reader = std::thread(&Impl::handle_client, this, conn);
        }
    }

    void reap(const std::shared_ptr<Connection>& conn) {
        if (conn->reader.joinable()) conn->reader.join();
        close(conn->sock);
    }

    void reap_finished() {
        std::vector<std::shared_ptr<Connection>> finished;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_connections.begin(); it != m_connections.end();) {
                if (it->second->done) {
                    finished.push_back(it->second);
                    it = m_connections.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& conn : finished) {
            reap(conn);
        }
    }

    // ------------------------------------------------------------------------
    // per connection
    // ------------------------------------------------------------------------

    void enqueue(const std::shared_ptr<Connection>& conn, const WireFrame& frame) {
        std::string bytes = broker_wire::encode(frame);
        std::lock_guard<std::mutex> lock(conn->out_mutex);
        if (conn->closing) {
            return;
        }
        if (conn->outbox_bytes + bytes.size() > m_options.max_outbox_bytes) {
            LOG_WARN("BROKER: Outbox of " + conn->network_id + " full, dropping " +
                     frame_type_to_string(frame.type) + " on " + frame.topic);
            return;
        }
        conn->outbox_bytes += bytes.size();
        conn->outbox.push_back(std::move(bytes));
        conn->out_cv.notify_one();
    }

    void writer_loop(std::shared_ptr<Connection> conn) {
        while (true) {
            std::string bytes;
            {
                std::unique_lock<std::mutex> lock(conn->out_mutex);
                conn->out_cv.wait(lock, [&conn]() { return conn->closing || !conn->outbox.empty(); });
                if (conn->outbox.empty()) {
                    return;
                }
                bytes = std::move(conn->outbox.front());
                conn->outbox.pop_front();
                conn->outbox_bytes -= bytes.size();
            }
            std::string error;
            if (!tcp_send_all(conn->sock, bytes.data(), bytes.size(), &error)) {
                LOG_WARN("TCP: Send to " + conn->network_id + " failed: " + error);
                shutdown(conn->sock, SHUT_RDWR);
                std::lock_guard<std::mutex> lock(conn->out_mutex);
                conn->closing = true;
                conn->outbox.clear();
                conn->outbox_bytes = 0;
                return;
            }
        }
    }

    void handle_client(std::shared_ptr<Connection> conn) {
        std::thread writer(&Impl::writer_loop, this, conn);

        const size_t max_body = broker_wire::kBodyOverhead + kMaxTopicLength + m_options.max_message_size;
        std::vector<char> buf(kRecvBufferSize);
        std::vector<uint8_t> receive_buffer;

        while (m_running) {
            const int ready = tcp_wait_readable(conn->sock, kPollIntervalMs);
            if (ready < 0) {
                LOG_WARN("TCP: select() failed for " + conn->network_id + ": " + std::string(strerror(errno)));
                break;
            }
            if (ready == 0) {
                continue;
            }

            const ssize_t n = recv(conn->sock, buf.data(), buf.size(), 0);
            if (n == 0) {
                LOG_INFO("TCP: " + conn->network_id + " disconnected");
                break;
            }
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                LOG_WARN("TCP: recv() failed for " + conn->network_id + ": " + std::string(strerror(errno)));
                break;
            }

            receive_buffer.insert(receive_buffer.end(), buf.data(), buf.data() + n);
            std::vector<WireFrame> frames;
            std::string error;
            if (!broker_wire::extract(receive_buffer, max_body, frames, &error)) {
                LOG_WARN("TCP: Malformed stream from " + conn->network_id + ": " + error);
                WireFrame err;
                err.type = FrameType::ERROR;
                err.payload = error;
                enqueue(conn, err);
                break;
            }
            for (auto& frame : frames) {
                handle_frame(conn, frame);
            }
        }

        drop_subscriptions(conn);
        {
            std::lock_guard<std::mutex> lock(conn->out_mutex);
            conn->closing = true;
            conn->out_cv.notify_one();
        }
        writer.join();
        conn->done = true;
    }

    void handle_frame(const std::shared_ptr<Connection>& conn, WireFrame& frame) {
        switch (frame.type) {
            case FrameType::PUBLISH:
                handle_publish(conn, frame);
                break;
            case FrameType::SUBSCRIBE:
                handle_subscribe(conn, frame);
                break;
            case FrameType::UNSUBSCRIBE: {
                SubscriptionId core_id = 0;
                {
                    std::lock_guard<std::mutex> lock(conn->subs_mutex);
                    auto it = conn->subs.find(frame.id);
                    if (it != conn->subs.end()) {
                        core_id = it->second;
                        conn->subs.erase(it);
                    }
                }
                if (core_id != 0) m_core.remove_subscription(core_id);
                break;
            }
            case FrameType::QUERY:
                handle_query(conn, frame);
                break;
            default:
                LOG_WARN("TCP: Unexpected " + std::string(frame_type_to_string(frame.type)) + " frame from " +
                         conn->network_id);
                break;
        }
    }

    void handle_publish(const std::shared_ptr<Connection>& conn, const WireFrame& frame) {
        if (frame.payload.size() > m_options.max_message_size || frame.topic.empty()) {
            WireFrame err;
            err.type = FrameType::ERROR;
            err.topic = frame.topic;
            err.payload = "publish rejected: empty topic or payload over " + std::to_string(m_options.max_message_size);
            enqueue(conn, err);
            return;
        }
        for (const auto& delivery : m_core.publish(frame.topic, frame.payload)) {
            delivery.sink(delivery.topic, *delivery.payload);
        }
    }

    void handle_subscribe(const std::shared_ptr<Connection>& conn, const WireFrame& frame) {
        std::weak_ptr<Connection> weak = conn;
        const uint64_t client_id = frame.id;
        const SubscriptionId core_id = m_core.add_subscription(
            frame.topic, [this, weak, client_id](const std::string& topic, const std::string& payload) {
                auto target = weak.lock();
                if (!target) return;
                WireFrame sample;
                sample.type = FrameType::SAMPLE;
                sample.id = client_id;
                sample.topic = topic;
                sample.payload = payload;
                enqueue(target, sample);
            });

        SubscriptionId replaced = 0;
        {
            std::lock_guard<std::mutex> lock(conn->subs_mutex);
            auto it = conn->subs.find(client_id);
            if (it != conn->subs.end()) replaced = it->second;
            conn->subs[client_id] = core_id;
        }
        if (replaced != 0) m_core.remove_subscription(replaced);
        LOG_DEBUG("BROKER: " + conn->network_id + " subscribed " + std::to_string(client_id) + " to " + frame.topic);
    }

    void handle_query(const std::shared_ptr<Connection>& conn, const WireFrame& frame) {
        const auto replies = m_core.query(frame.topic);
        for (const auto& reply : replies) {
            WireFrame r;
            r.type = FrameType::REPLY;
            r.id = frame.id;
            r.topic = reply.first;
            r.payload = reply.second;
            enqueue(conn, r);
        }
        WireFrame end;
        end.type = FrameType::REPLY_END;
        end.id = frame.id;
        enqueue(conn, end);
        LOG_DEBUG("BROKER: Query " + frame.topic + " from " + conn->network_id + ": " +
                  std::to_string(replies.size()) + " match(es)");
    }

    void drop_subscriptions(const std::shared_ptr<Connection>& conn) {
        std::map<uint64_t, SubscriptionId> subs;
        {
            std::lock_guard<std::mutex> lock(conn->subs_mutex);
            subs.swap(conn->subs);
        }
        for (const auto& kv : subs) {
            m_core.remove_subscription(kv.second);
        }
    }

    Options m_options;
    std::shared_ptr<ChunkStore> m_store;
    BrokerCore m_core;

    std::atomic<bool> m_running;
    int m_server_sock;
    int m_port;
    std::thread m_accept_thread;

    mutable std::mutex m_mutex;
    std::map<int, std::shared_ptr<Connection>> m_connections;
};

BrokerServer::BrokerServer(Options options) : m_impl(std::make_unique<Impl>(std::move(options))) {}
BrokerServer::~BrokerServer() = default;
bool BrokerServer::start(int port, std::string* error) { return m_impl->start(port, error); }
void BrokerServer::stop() { m_impl->stop(); }
bool BrokerServer::is_running() const { return m_impl->is_running(); }
int BrokerServer::port() const { return m_impl->port(); }
size_t BrokerServer::connection_count() const { return m_impl->connection_count(); }
BrokerCore& BrokerServer::core() { return m_impl->core(); }

} // namespace litecdn
