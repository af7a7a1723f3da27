#ifndef LITECDN_BROKER_CORE_H
#define LITECDN_BROKER_CORE_H

#include "chunk_store.h"
#include "pubsub_transport.h"
#include "topic_scheme.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace litecdn {

// Receives routed samples: (topic, payload).
using BrokerSink = std::function<void(const std::string&, const std::string&)>;

// One routed copy, for the substrate to hand over in whatever way it delivers.
struct Delivery {
    SubscriptionId subscription = 0;
    BrokerSink sink;
    std::string topic;
    std::shared_ptr<const std::string> payload;
};

/**
 * Topic router plus storage node, shared by the local and the TCP substrate.
 *
 * publish() stores manifest and chunk payloads (opaque, never decoded), then
 * returns one Delivery per matching subscription. A retransmission request is
 * routed like any sample and is also answered from the store by re-routing the
 * stored topics it names. Acks are routed only.
 *
 * Sinks are never invoked under the core's lock; the substrate runs them.
 */
class BrokerCore {
public:
    // store may be null: the core then routes only and answers nothing.
    BrokerCore(TopicScheme topics, std::shared_ptr<ChunkStore> store);

    BrokerCore(const BrokerCore&) = delete;
    BrokerCore& operator=(const BrokerCore&) = delete;

    SubscriptionId add_subscription(const std::string& pattern, BrokerSink sink);
    bool remove_subscription(SubscriptionId id);

    std::vector<Delivery> publish(const std::string& topic, const std::string& payload);

    // Stored (topic, payload) pairs matching selector; empty without a store.
    std::vector<std::pair<std::string, std::string>> query(const std::string& selector) const;

    size_t subscription_count() const;
    const TopicScheme& topics() const { return m_topics; }
    std::shared_ptr<ChunkStore> store() const { return m_store; }

    uint64_t published() const { return m_published.load(); }
    uint64_t retransmits_served() const { return m_retransmits_served.load(); }

private:
    struct Subscription {
        std::string pattern;
        BrokerSink sink;
    };

    void route(const std::string& topic, std::shared_ptr<const std::string> payload,
               std::vector<Delivery>& out) const;
    void serve_retransmit(const std::string& payload, std::vector<Delivery>& out);

    TopicScheme m_topics;
    std::shared_ptr<ChunkStore> m_store;

    mutable std::mutex m_mutex;
    std::map<SubscriptionId, Subscription> m_subscriptions;
    SubscriptionId m_next_id = 1;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_retransmits_served{0};
};

} // namespace litecdn

#endif // LITECDN_BROKER_CORE_H
