/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: socket_utils.h

    Description:
        Thin POSIX TCP helpers shared by the router, dealer and pub/sub
        endpoints: listener setup, outbound connect, deadlines, and blocking
        read/write of one framed multipart message (common/message.h).

        All functions log their failures and report them through the return
        value; the only exception that escapes is ProtocolError from
        read_message() when the peer sends an impossible length prefix.
*******************************************************************************/

#ifndef SOCKET_UTILS_H
#define SOCKET_UTILS_H

#include "common/message.h"

#include <cstdint>
#include <string>

namespace roomalloc {
namespace net {

// Bound, listening, SO_REUSEADDR socket on INADDR_ANY:port, or -1.
int create_listener(uint16_t port, int backlog = 64);

// Connected socket, or -1.
int connect_to(const std::string& host, uint16_t port);

void close_socket(int& fd);

// 0 disables the corresponding deadline.
bool set_timeouts(int fd, int send_timeout_ms, int recv_timeout_ms);

// 1 = readable, 0 = timeout, -1 = error/hangup
int wait_readable(int fd, int timeout_ms);

bool write_message(int fd, const Multipart& frames);

// Blocks until one whole message has been read. Returns false on EOF or a
// socket error (including an expired receive deadline).
bool read_message(int fd, Multipart& out);

} // namespace net
} // namespace roomalloc

#endif // SOCKET_UTILS_H
