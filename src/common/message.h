/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: message.h

    Description:
        Wire framing shared by every TCP link in the service. A message is a
        list of opaque byte frames ("multipart"); the framing knows nothing
        about JSON, requests or resources.

        Wire Layout (all integers big-endian):

            +-----------+-------------+-----------+---------+-----------+---------+
            | body_len  | frame_count | len[0]    | bytes   | len[1]    | bytes   | ...
            | u32       | u32         | u32       | len[0]  | u32       | len[1]  |
            +-----------+-------------+-----------+---------+-----------+---------+
                        |<------------------- body_len bytes ------------------->|

        Envelopes:
            client  -> broker   ["", request_json]
            broker  -> client   ["", reply_json]
            broker  -> worker   [client_address, "", request_json]
            worker  -> broker   [client_address, "", reply_json]
            worker  -> broker   ["READY"]                (registration / capacity)
            publisher -> subscriber  [payload]             (heartbeat and sync feeds)

        The first message on every connection to a router endpoint is the
        identity greeting: a single frame holding the peer's chosen identity
        (empty asks the router to assign one).
*******************************************************************************/

#ifndef MESSAGE_H
#define MESSAGE_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstring>

namespace roomalloc {

using Multipart = std::vector<std::string>;

// Registration / availability sentinel sent by workers on the backend channel.
extern const char* const READY_SIGNAL;

// Tag prefixed to every heartbeat beacon: "HEARTBEAT 2026-10-19T14:32:15.123".
extern const char* const HEARTBEAT_TAG;

// Upper bound on body_len. Larger prefixes are treated as stream corruption.
const uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

// Byte-order helpers (the service only runs on little-endian Linux hosts).
inline uint32_t hton32(uint32_t val) {
    return ((val & 0xFF) << 24) | ((val & 0xFF00) << 8) |
           ((val >> 8) & 0xFF00) | ((val >> 24) & 0xFF);
}

inline uint32_t ntoh32(uint32_t val) { return hton32(val); }

// Full wire image of `frames`, including the body_len prefix.
std::vector<uint8_t> serialize_message(const Multipart& frames);

// Decodes a body (the bytes after body_len). Throws ProtocolError.
Multipart deserialize_body(const uint8_t* data, size_t size);

// If `buffer` starts with a complete message, decodes it into `out`, erases
// it from the buffer and returns true. Returns false when more bytes are
// needed. Throws ProtocolError on an oversized or malformed message.
bool extract_message(std::vector<uint8_t>& buffer, Multipart& out);

// "3 frames [0, 36, 112]" - for debug logs.
std::string describe(const Multipart& frames);

inline bool is_ready_signal(const Multipart& frames) {
    return frames.size() == 1 && frames[0] == READY_SIGNAL;
}

inline Multipart make_client_envelope(const std::string& payload) {
    return Multipart{"", payload};
}

inline Multipart make_worker_envelope(const std::string& client_address,
                                      const std::string& payload) {
    return Multipart{client_address, "", payload};
}

} // namespace roomalloc

#endif // MESSAGE_H
