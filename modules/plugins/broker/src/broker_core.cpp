#include "broker_core.h"
#include "logger.h"
#include "topic_matcher.h"
#include "transfer_messages.h"

namespace litecdn {

BrokerCore::BrokerCore(TopicScheme topics, std::shared_ptr<ChunkStore> store)
    : m_topics(std::move(topics)), m_store(std::move(store)) {}

SubscriptionId BrokerCore::add_subscription(const std::string& pattern, BrokerSink sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const SubscriptionId id = m_next_id++;
    m_subscriptions[id] = Subscription{pattern, std::move(sink)};
    LOG_DEBUG("BROKER: Subscription " + std::to_string(id) + " on " + pattern);
    return id;
}

bool BrokerCore::remove_subscription(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.erase(id) != 0;
}

size_t BrokerCore::subscription_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

void BrokerCore::route(const std::string& topic, std::shared_ptr<const std::string> payload,
                       std::vector<Delivery>& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& kv : m_subscriptions) {
        if (topic_matches(kv.second.pattern, topic)) {
            out.push_back(Delivery{kv.first, kv.second.sink, topic, payload});
        }
    }
}

std::vector<Delivery> BrokerCore::publish(const std::string& topic, const std::string& payload) {
    m_published++;
    std::vector<Delivery> out;

    ParsedTopic parsed;
    const bool ours = m_topics.parse(topic, parsed);
    if (ours && m_store && (parsed.role == TopicRole::MANIFEST || parsed.role == TopicRole::CHUNK)) {
        std::string error;
        if (!m_store->put(topic, payload, &error)) {
            // routing goes on; only later retransmissions miss this entry
            LOG_WARN("BROKER: Not stored: " + error);
        }
    }

    route(topic, std::make_shared<const std::string>(payload), out);

    if (ours && m_store && parsed.role == TopicRole::RETRANSMIT) {
        serve_retransmit(payload, out);
    }
    return out;
}

void BrokerCore::serve_retransmit(const std::string& payload, std::vector<Delivery>& out) {
    RetransmitRequest req;
    std::string error;
    if (!transfer_messages::decode_retransmit(payload, req, &error)) {
        LOG_WARN("BROKER: Ignoring malformed retransmit request: " + error);
        return;
    }

    size_t served = 0;
    std::string stored;
    if (req.manifest) {
        const std::string topic = m_topics.manifest_topic(req.object_id);
        if (m_store->get(topic, stored)) {
            route(topic, std::make_shared<const std::string>(std::move(stored)), out);
            served++;
        }
    }
    for (uint32_t index : req.indices) {
        const std::string topic = m_topics.chunk_topic(req.object_id, index);
        if (m_store->get(topic, stored)) {
            route(topic, std::make_shared<const std::string>(std::move(stored)), out);
            served++;
        }
    }

    if (served > 0) {
        m_retransmits_served++;
        LOG_DEBUG("BROKER: Re-routed " + std::to_string(served) + " stored entr" + (served == 1 ? "y" : "ies") +
                  " for " + req.object_id);
    }
}

std::vector<std::pair<std::string, std::string>> BrokerCore::query(const std::string& selector) const {
    if (!m_store) {
        return {};
    }
    return m_store->match(selector);
}

} // namespace litecdn
