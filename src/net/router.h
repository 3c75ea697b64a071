/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: router.h

    Description:
        Server side of an addressed message channel. Peers connect over TCP
        and introduce themselves with an identity greeting; from then on every
        inbound message is tagged with that identity, and outbound messages
        are routed to a peer by identity. The broker binds two of these: the
        client-facing frontend and the worker-facing backend.

        Identity Rules:
        - a non-empty greeting is used as-is
        - an empty greeting, or one already held by a live connection, is
          replaced by a generated "peer-<n>"
        - the identity is released when the connection closes

    Threading:
        Not thread-safe. One thread drives poll() / pop() / send(); the
        broker's event loop is that thread.

    Example:
        RouterEndpoint frontend("frontend");
        frontend.bind(5555);
        while (running) {
            RouterEndpoint::poll({&frontend}, 100);
            RoutedMessage msg;
            while (frontend.pop(msg)) {
                frontend.send(msg.address, msg.frames);   // echo
            }
        }
*******************************************************************************/

#ifndef ROUTER_H
#define ROUTER_H

#include "common/message.h"

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace roomalloc {
namespace net {

struct RoutedMessage {
    std::string address;
    Multipart frames;
};

class RouterEndpoint {
private:
    struct Connection {
        int fd;
        std::string identity;     // empty until the greeting arrives
        std::vector<uint8_t> buffer;
    };

    std::string name_;
    int listen_fd_;
    uint16_t port_;
    std::map<int, Connection> connections_;
    std::map<std::string, int> by_identity_;
    std::deque<RoutedMessage> inbox_;
    uint64_t next_peer_;
    int send_timeout_ms_;

    void accept_pending();
    // false when the connection must be closed
    bool read_available(Connection& conn);
    bool handle_frames(Connection& conn, Multipart& frames);
    void drop_connection(int fd);

public:
    explicit RouterEndpoint(const std::string& name, int send_timeout_ms = 5000);
    ~RouterEndpoint();

    RouterEndpoint(const RouterEndpoint&) = delete;
    RouterEndpoint& operator=(const RouterEndpoint&) = delete;

    bool bind(uint16_t port);
    void close();

    // Waits up to timeout_ms for activity on any of the endpoints, accepts
    // and reads whatever is ready. Returns the number of queued inbound
    // messages across all endpoints, including ones queued earlier and not
    // yet popped.
    static size_t poll(const std::vector<RouterEndpoint*>& endpoints, int timeout_ms);

    bool has_pending() const { return !inbox_.empty(); }
    size_t pending() const { return inbox_.size(); }
    bool pop(RoutedMessage& out);
    // Puts a popped message back at the front of the queue.
    void requeue_front(const RoutedMessage& msg);

    // false if the peer is unknown or the send failed (the connection is then
    // closed).
    bool send(const std::string& address, const Multipart& frames);

    bool is_connected(const std::string& address) const;
    size_t peer_count() const { return by_identity_.size(); }
    uint16_t port() const { return port_; }
    const std::string& name() const { return name_; }
};

} // namespace net
} // namespace roomalloc

#endif // ROUTER_H
