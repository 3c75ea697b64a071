/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: allocation_client.cpp
*******************************************************************************/

#include "client/allocation_client.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/message.h"

namespace roomalloc {

AllocationClient::AllocationClient(const ClientConfig& config) : config_(config) {
}

void AllocationClient::ensure_connected() {
    if (connection_ && connection_->connected()) {
        return;
    }

    connection_ = std::make_unique<net::DealerConnection>();
    if (!connection_->connect(config_.broker_host, config_.broker_port,
                              config_.identity, config_.send_timeout_ms)) {
        connection_.reset();
        throw CommunicationError("Cannot reach broker at " + config_.broker_host + ":" +
                                 std::to_string(config_.broker_port), false);
    }
}

std::string AllocationClient::submit_raw(const std::string& payload) {
    ensure_connected();

    if (!connection_->send(make_client_envelope(payload))) {
        connection_.reset();
        throw CommunicationError("Failed to send request to broker", false);
    }

    Multipart frames;
    if (!connection_->receive(frames, config_.recv_timeout_ms)) {
        bool timed_out = connection_->connected();
        connection_.reset();
        if (timed_out) {
            throw CommunicationError("No reply from broker within " +
                                     std::to_string(config_.recv_timeout_ms) + " ms", true);
        }
        throw CommunicationError("Connection to broker lost", false);
    }

    if (frames.size() != 2 || !frames[0].empty()) {
        connection_.reset();
        throw CommunicationError("Malformed reply envelope: " + describe(frames), false);
    }
    return frames[1];
}

AllocationResponse AllocationClient::submit(const AllocationRequest& request) {
    std::string reply = submit_raw(to_json(request));
    try {
        return parse_response(reply);
    } catch (const ProtocolError& e) {
        throw CommunicationError(std::string("Unreadable reply: ") + e.what(), false);
    }
}

void AllocationClient::close() {
    connection_.reset();
}

} // namespace roomalloc
