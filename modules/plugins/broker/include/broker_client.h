#ifndef LITECDN_BROKER_CLIENT_H
#define LITECDN_BROKER_CLIENT_H

#include "pubsub_transport.h"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace litecdn {

/**
 * PubSubTransport over a TCP connection to a BrokerServer.
 *
 * Samples and query replies are dispatched on the client's reader thread. When
 * the connection drops, publish() fails with a transport error and pending
 * queries complete with whatever replies arrived.
 */
class BrokerClient : public PubSubTransport {
public:
    explicit BrokerClient(size_t max_message_size = 16 * 1024 * 1024);
    ~BrokerClient() override;

    BrokerClient(const BrokerClient&) = delete;
    BrokerClient& operator=(const BrokerClient&) = delete;

    bool connect(const std::string& host, int port, int timeout_ms, std::string* error);
    void disconnect();
    bool is_connected() const { return m_connected.load(); }

    bool publish(const std::string& topic, const std::string& payload, std::string* error) override;
    SubscriptionId subscribe(const std::string& pattern, SampleCallback on_sample, std::string* error) override;
    void unsubscribe(SubscriptionId id) override;

    bool supports_query() const override { return true; }
    bool query(const std::string& selector,
               SampleCallback on_reply,
               QueryDoneCallback on_done,
               std::string* error) override;

    size_t max_message_size() const override { return m_max_message_size; }

private:
    struct PendingQuery {
        SampleCallback on_reply;
        QueryDoneCallback on_done;
    };

    bool send_frame(const std::string& bytes, std::string* error);
    void reader_loop();
    void fail_pending_queries();

    const size_t m_max_message_size;
    std::string m_network_id;

    int m_sock;
    std::atomic<bool> m_connected;
    std::atomic<bool> m_stopping;
    std::thread m_reader;
    std::mutex m_send_mutex;

    std::mutex m_mutex;   // guards the tables below
    std::map<SubscriptionId, SampleCallback> m_subscriptions;
    std::map<uint64_t, PendingQuery> m_queries;
    uint64_t m_next_id = 1;
};

} // namespace litecdn

#endif // LITECDN_BROKER_CLIENT_H
