#include "local_broker.h"
#include "logger.h"

#include <chrono>

namespace litecdn {

// ============================================================================
// LocalBroker
// ============================================================================

std::shared_ptr<LocalBroker> LocalBroker::create(const Options& options) {
    return std::make_shared<LocalBroker>(CreateKey{}, options);
}

LocalBroker::LocalBroker(CreateKey, const Options& options)
    : m_options(options),
      m_core(TopicScheme(options.resource_root),
             options.storage ? std::make_shared<ChunkStore>(TopicScheme(options.resource_root)) : nullptr),
      m_pool(options.delivery_threads) {
    m_timers.start();
    LOG_DEBUG("BROKER: Local broker on " + m_core.topics().root() + " with " +
              std::to_string(m_pool.worker_count()) + " delivery thread(s)");
}

LocalBroker::~LocalBroker() {
    // delayed copies still pending are dropped
    m_timers.stop();
    m_pool.shutdown(true);
}

std::unique_ptr<LocalTransport> LocalBroker::connect() {
    return std::make_unique<LocalTransport>(shared_from_this());
}

void LocalBroker::set_fault_hook(FaultHook hook) {
    std::lock_guard<std::mutex> lock(m_fault_mutex);
    m_fault_hook = std::move(hook);
}

void LocalBroker::set_publish_fail_filter(PublishFailFilter filter) {
    std::lock_guard<std::mutex> lock(m_fault_mutex);
    m_fail_filter = std::move(filter);
}

void LocalBroker::clear_faults() {
    std::lock_guard<std::mutex> lock(m_fault_mutex);
    m_fault_hook = nullptr;
    m_fail_filter = nullptr;
}

bool LocalBroker::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(m_idle_mutex);
    return m_idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() { return m_in_flight == 0; });
}

bool LocalBroker::publish(const std::string& topic, const std::string& payload, std::string* error) {
    if (payload.size() > m_options.max_message_size) {
        if (error) *error = "payload of " + std::to_string(payload.size()) + " bytes exceeds the limit of " +
                            std::to_string(m_options.max_message_size);
        return false;
    }

    PublishFailFilter filter;
    {
        std::lock_guard<std::mutex> lock(m_fault_mutex);
        filter = m_fail_filter;
    }
    if (filter && filter(topic)) {
        if (error) *error = "injected publish failure on " + topic;
        return false;
    }

    for (auto& delivery : m_core.publish(topic, payload)) {
        dispatch(std::move(delivery));
    }
    return true;
}

void LocalBroker::dispatch(Delivery delivery) {
    FaultHook hook;
    {
        std::lock_guard<std::mutex> lock(m_fault_mutex);
        hook = m_fault_hook;
    }

    FaultDecision decision;
    if (hook) {
        std::string copy = *delivery.payload;
        decision = hook(delivery.topic, copy);
        if (copy != *delivery.payload) {
            delivery.payload = std::make_shared<const std::string>(std::move(copy));
        }
    }

    if (decision.drop) {
        m_dropped++;
        return;
    }
    for (int i = 0; i <= decision.extra_copies; ++i) {
        enqueue_copy(delivery.topic, delivery.sink, delivery.payload, decision.delay_ms);
    }
}

void LocalBroker::enqueue_copy(const std::string& topic, BrokerSink sink,
                               std::shared_ptr<const std::string> payload, int delay_ms) {
    {
        std::lock_guard<std::mutex> lock(m_idle_mutex);
        m_in_flight++;
    }

    auto task = [this, topic, sink, payload]() { run_copy(topic, sink, *payload); };

    if (delay_ms > 0) {
        const TimerId id = m_timers.runAfter(delay_ms, [this, task]() {
            if (!m_pool.submit_any(task)) {
                finish_one();
            }
        });
        if (id == 0) {
            finish_one();
        }
        return;
    }
    if (!m_pool.submit_any(task)) {
        finish_one();
    }
}

void LocalBroker::run_copy(const std::string& topic, const BrokerSink& sink, const std::string& payload) {
    try {
        sink(topic, payload);
        m_delivered++;
    } catch (const std::exception& e) {
        LOG_ERROR("BROKER: Subscriber threw on " + topic + ": " + e.what());
    }
    finish_one();
}

void LocalBroker::finish_one() {
    std::lock_guard<std::mutex> lock(m_idle_mutex);
    if (m_in_flight > 0 && --m_in_flight == 0) {
        m_idle_cv.notify_all();
    }
}

// ============================================================================
// LocalTransport
// ============================================================================

LocalTransport::LocalTransport(std::shared_ptr<LocalBroker> broker)
    : m_broker(std::move(broker)),
      m_supports_query(m_broker->m_core.store() != nullptr),
      m_max_message_size(m_broker->max_message_size()) {}

LocalTransport::~LocalTransport() {
    std::set<SubscriptionId> subs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subs.swap(m_subscriptions);
    }
    for (SubscriptionId id : subs) {
        m_broker->m_core.remove_subscription(id);
    }
}

bool LocalTransport::publish(const std::string& topic, const std::string& payload, std::string* error) {
    if (payload.size() > m_max_message_size.load()) {
        if (error) *error = "payload of " + std::to_string(payload.size()) + " bytes exceeds the limit of " +
                            std::to_string(m_max_message_size.load());
        return false;
    }
    return m_broker->publish(topic, payload, error);
}

SubscriptionId LocalTransport::subscribe(const std::string& pattern, SampleCallback on_sample, std::string* error) {
    if (pattern.empty() || !on_sample) {
        if (error) *error = "empty pattern or callback";
        return 0;
    }
    const SubscriptionId id = m_broker->m_core.add_subscription(pattern, std::move(on_sample));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscriptions.insert(id);
    return id;
}

void LocalTransport::unsubscribe(SubscriptionId id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_subscriptions.erase(id) == 0) {
            return;
        }
    }
    m_broker->m_core.remove_subscription(id);
}

bool LocalTransport::query(const std::string& selector,
                           SampleCallback on_reply,
                           QueryDoneCallback on_done,
                           std::string* error) {
    if (!supports_query()) {
        if (error) *error = "query not supported";
        return false;
    }

    auto replies = m_broker->m_core.query(selector);
    LocalBroker* broker = m_broker.get();
    {
        std::lock_guard<std::mutex> lock(broker->m_idle_mutex);
        broker->m_in_flight++;
    }
    const bool queued = broker->m_pool.submit_any([broker, replies, on_reply, on_done]() {
        try {
            for (const auto& reply : replies) {
                if (on_reply) on_reply(reply.first, reply.second);
            }
            if (on_done) on_done();
        } catch (const std::exception& e) {
            LOG_ERROR("BROKER: Query callback threw: " + std::string(e.what()));
        }
        broker->finish_one();
    });
    if (!queued) {
        broker->finish_one();
        if (error) *error = "broker is shutting down";
        return false;
    }
    return true;
}

} // namespace litecdn
