/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: message.cpp

    Description:
        Serialization of multipart messages (see message.h for the layout).
        Decoding is bounds-checked at every step; a truncated or inconsistent
        body raises ProtocolError and the caller drops the connection.
*******************************************************************************/

#include "common/message.h"
#include "common/errors.h"

#include <sstream>

namespace roomalloc {

const char* const READY_SIGNAL = "READY";
const char* const HEARTBEAT_TAG = "HEARTBEAT";

static void append_u32(std::vector<uint8_t>& buffer, uint32_t value) {
    uint32_t net = hton32(value);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&net);
    buffer.insert(buffer.end(), bytes, bytes + 4);
}

static uint32_t read_u32(const uint8_t*& ptr, const uint8_t* end, const char* what) {
    if (ptr + 4 > end) {
        throw ProtocolError(std::string("Buffer underflow reading ") + what);
    }
    uint32_t value;
    std::memcpy(&value, ptr, 4);
    ptr += 4;
    return ntoh32(value);
}

std::vector<uint8_t> serialize_message(const Multipart& frames) {
    std::vector<uint8_t> buffer;

    // Reserve the body_len slot and patch it once the body is written
    buffer.resize(4);

    append_u32(buffer, static_cast<uint32_t>(frames.size()));
    for (const auto& frame : frames) {
        append_u32(buffer, static_cast<uint32_t>(frame.size()));
        buffer.insert(buffer.end(), frame.begin(), frame.end());
    }

    uint32_t body_len = hton32(static_cast<uint32_t>(buffer.size() - 4));
    std::memcpy(buffer.data(), &body_len, 4);
    return buffer;
}

Multipart deserialize_body(const uint8_t* data, size_t size) {
    const uint8_t* ptr = data;
    const uint8_t* end = data + size;

    uint32_t count = read_u32(ptr, end, "frame count");
    // Each frame needs at least its 4-byte length
    if (static_cast<uint64_t>(count) * 4 > static_cast<uint64_t>(end - ptr)) {
        throw ProtocolError("Frame count " + std::to_string(count) +
                            " exceeds message body");
    }

    Multipart frames;
    frames.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t len = read_u32(ptr, end, "frame length");
        if (len > static_cast<uint64_t>(end - ptr)) {
            throw ProtocolError("Buffer underflow reading frame " + std::to_string(i));
        }
        frames.emplace_back(reinterpret_cast<const char*>(ptr), len);
        ptr += len;
    }

    if (ptr != end) {
        throw ProtocolError("Trailing bytes after last frame");
    }
    return frames;
}

bool extract_message(std::vector<uint8_t>& buffer, Multipart& out) {
    if (buffer.size() < 4) {
        return false;
    }

    uint32_t body_len;
    std::memcpy(&body_len, buffer.data(), 4);
    body_len = ntoh32(body_len);

    if (body_len == 0 || body_len > MAX_MESSAGE_SIZE) {
        throw ProtocolError("Invalid message size: " + std::to_string(body_len));
    }
    if (buffer.size() < 4 + static_cast<size_t>(body_len)) {
        return false;
    }

    out = deserialize_body(buffer.data() + 4, body_len);
    buffer.erase(buffer.begin(), buffer.begin() + 4 + body_len);
    return true;
}

std::string describe(const Multipart& frames) {
    std::stringstream ss;
    ss << frames.size() << " frames [";
    for (size_t i = 0; i < frames.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << frames[i].size();
    }
    ss << "]";
    return ss.str();
}

} // namespace roomalloc
