#ifndef LITECDN_PUBSUB_TRANSPORT_H
#define LITECDN_PUBSUB_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <string>

namespace litecdn {

using SubscriptionId = uint64_t;

// (topic, payload). Invoked on transport threads, possibly concurrently and in any order.
using SampleCallback = std::function<void(const std::string&, const std::string&)>;
using QueryDoneCallback = std::function<void()>;

/**
 * Topic-addressed publish/subscribe substrate.
 *
 * Patterns use '/' separated segments; '*' matches exactly one segment and '**'
 * matches any number of segments (see topic_matches()).
 *
 * Delivery may be lossy, duplicated and reordered. A publish() that returns true
 * only means the transport accepted the payload.
 */
class PubSubTransport {
public:
    virtual ~PubSubTransport() = default;

    virtual bool publish(const std::string& topic, const std::string& payload, std::string* error) = 0;

    // Returns 0 on failure.
    virtual SubscriptionId subscribe(const std::string& pattern, SampleCallback on_sample, std::string* error) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;

    // Retrieval of stored values. on_reply may be called any number of times, then
    // on_done exactly once, unless query() itself returns false.
    virtual bool supports_query() const = 0;
    virtual bool query(const std::string& selector,
                       SampleCallback on_reply,
                       QueryDoneCallback on_done,
                       std::string* error) = 0;

    // Largest payload publish() accepts, in bytes.
    virtual size_t max_message_size() const = 0;
};

} // namespace litecdn

#endif // LITECDN_PUBSUB_TRANSPORT_H
