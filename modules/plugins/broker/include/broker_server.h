#ifndef LITECDN_BROKER_SERVER_H
#define LITECDN_BROKER_SERVER_H

#include "broker_core.h"

#include <memory>
#include <string>

namespace litecdn {

/**
 * TCP storage node.
 *
 * Accepts BrokerClient connections, routes their publishes through a BrokerCore
 * and keeps manifests and chunks (in memory, or under store_dir) so late
 * downloaders can query them and request retransmissions. Payloads are relayed
 * as opaque bytes; the server never reassembles an object.
 *
 * One reader and one writer thread per connection. Writers drain a per-connection
 * outbox, so a slow client never blocks routing for the others.
 */
class BrokerServer {
public:
    struct Options {
        std::string resource_root = kDefaultResourceRoot;
        std::string store_dir;                       // empty: memory only
        size_t max_message_size = 16 * 1024 * 1024;
        size_t max_outbox_bytes = 256 * 1024 * 1024; // per connection; beyond it samples are dropped

        static Options from_config();
    };

    explicit BrokerServer(Options options);
    ~BrokerServer();

    BrokerServer(const BrokerServer&) = delete;
    BrokerServer& operator=(const BrokerServer&) = delete;

    // port 0 binds an ephemeral port; see port().
    bool start(int port, std::string* error);
    void stop();

    bool is_running() const;
    int port() const;
    size_t connection_count() const;

    BrokerCore& core();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace litecdn

#endif // LITECDN_BROKER_SERVER_H
