#ifndef LITECDN_LOCAL_BROKER_H
#define LITECDN_LOCAL_BROKER_H

#include "broker_core.h"
#include "event_thread_pool.h"
#include "pubsub_transport.h"
#include "timer_queue.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace litecdn {

// What happens to one routed copy.
struct FaultDecision {
    bool drop = false;
    int extra_copies = 0;   // duplicates delivered on top of the original
    int delay_ms = 0;
};

// May rewrite payload (tampering); it is a private copy per delivery.
using FaultHook = std::function<FaultDecision(const std::string& topic, std::string& payload)>;

// Returning true makes publish() on that topic fail with a transport error.
using PublishFailFilter = std::function<bool(const std::string& topic)>;

class LocalTransport;

/**
 * In-process pub/sub substrate.
 *
 * Every routed copy is handed to a worker pool with submit_any(), so samples
 * arrive asynchronously, concurrently and in no guaranteed order, the same
 * contract a real overlay gives. Fault hooks make loss, duplication, delay,
 * tampering and publish failures reproducible in tests.
 */
class LocalBroker : public std::enable_shared_from_this<LocalBroker> {
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    struct Options {
        std::string resource_root = kDefaultResourceRoot;
        size_t delivery_threads = 4;
        bool storage = true;                 // keep manifests/chunks, answer queries and retransmissions
        size_t max_message_size = 16 * 1024 * 1024;
    };

    static std::shared_ptr<LocalBroker> create(const Options& options);
    // Only create() can name the key; connect() needs shared ownership.
    LocalBroker(CreateKey, const Options& options);
    ~LocalBroker();

    LocalBroker(const LocalBroker&) = delete;
    LocalBroker& operator=(const LocalBroker&) = delete;

    std::unique_ptr<LocalTransport> connect();

    void set_fault_hook(FaultHook hook);
    void set_publish_fail_filter(PublishFailFilter filter);
    void clear_faults();

    // Waits until no delivery is queued or delayed. False on timeout.
    bool wait_idle(int timeout_ms);

    BrokerCore& core() { return m_core; }
    size_t max_message_size() const { return m_options.max_message_size; }

    uint64_t delivered() const { return m_delivered.load(); }
    uint64_t dropped() const { return m_dropped.load(); }

private:
    friend class LocalTransport;

    bool publish(const std::string& topic, const std::string& payload, std::string* error);
    void dispatch(Delivery delivery);
    void enqueue_copy(const std::string& topic, BrokerSink sink,
                      std::shared_ptr<const std::string> payload, int delay_ms);
    void run_copy(const std::string& topic, const BrokerSink& sink, const std::string& payload);
    void finish_one();

    Options m_options;
    BrokerCore m_core;
    EventThreadPool m_pool;
    TimerQueue m_timers;

    mutable std::mutex m_fault_mutex;
    FaultHook m_fault_hook;
    PublishFailFilter m_fail_filter;

    std::mutex m_idle_mutex;
    std::condition_variable m_idle_cv;
    size_t m_in_flight = 0;

    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_dropped{0};
};

/**
 * One endpoint on a LocalBroker. Subscriptions made through it are removed when
 * it is destroyed.
 */
class LocalTransport : public PubSubTransport {
public:
    explicit LocalTransport(std::shared_ptr<LocalBroker> broker);
    ~LocalTransport() override;

    bool publish(const std::string& topic, const std::string& payload, std::string* error) override;
    SubscriptionId subscribe(const std::string& pattern, SampleCallback on_sample, std::string* error) override;
    void unsubscribe(SubscriptionId id) override;

    bool supports_query() const override { return m_supports_query.load(); }
    bool query(const std::string& selector,
               SampleCallback on_reply,
               QueryDoneCallback on_done,
               std::string* error) override;

    size_t max_message_size() const override { return m_max_message_size.load(); }

    // Test knobs.
    void set_supports_query(bool enabled) { m_supports_query = enabled; }
    void set_max_message_size(size_t bytes) { m_max_message_size = bytes; }

private:
    std::shared_ptr<LocalBroker> m_broker;
    std::atomic<bool> m_supports_query;
    std::atomic<size_t> m_max_message_size;

    std::mutex m_mutex;
    std::set<SubscriptionId> m_subscriptions;
};

} // namespace litecdn

#endif // LITECDN_LOCAL_BROKER_H
