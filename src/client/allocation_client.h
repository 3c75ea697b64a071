/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: allocation_client.h

    Description:
        Thin submission client: one connection to the broker frontend, one
        request at a time. Both hops have fixed deadlines; when one expires,
        or the broker connection drops, submit() throws CommunicationError,
        which the caller may retry. After a CommunicationError the client
        reconnects on the next submit() so a late reply to the abandoned
        request cannot be mistaken for the next one.
*******************************************************************************/

#ifndef ALLOCATION_CLIENT_H
#define ALLOCATION_CLIENT_H

#include "common/protocol.h"
#include "net/dealer.h"

#include <cstdint>
#include <memory>
#include <string>

namespace roomalloc {

struct ClientConfig {
    std::string broker_host = "localhost";
    uint16_t broker_port = 5555;
    std::string identity;           // empty = assigned by the broker
    int send_timeout_ms = 5000;
    int recv_timeout_ms = 10000;
};

class AllocationClient {
private:
    ClientConfig config_;
    std::unique_ptr<net::DealerConnection> connection_;

    void ensure_connected();

public:
    explicit AllocationClient(const ClientConfig& config);

    // Throws CommunicationError.
    AllocationResponse submit(const AllocationRequest& request);

    // Sends `payload` as-is and returns the raw reply payload.
    // Throws CommunicationError.
    std::string submit_raw(const std::string& payload);

    void close();
};

} // namespace roomalloc

#endif // ALLOCATION_CLIENT_H
