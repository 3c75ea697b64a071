/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: protocol.h

    Description:
        JSON documents exchanged between the submission client, the broker,
        the allocator workers and the standby replica. Encoding and decoding
        go through JsonCpp; everything above this header works with the
        typed structs only.

        Request (client -> worker):
            {"requester": "Engineering", "program": "Systems", "term": 1,
             "rooms_requested": 3, "labs_requested": 2, "min_capacity": 30}

        Responses (worker -> client):
            success      {"requester", "program", "term",
                          "rooms_assigned": [...], "labs_assigned": [...],
                          "notice": "..."}              (notice optional)
            unavailable  {"unavailable": "..."}
            error        {"error": "..."}

        Snapshot (state-sync feed):
            {"resources": {"S001": {"id", "kind", "status", "capacity",
                                    "requester", "program",
                                    "requested_at", "assigned_at"}, ...}}
*******************************************************************************/

#ifndef PROTOCOL_H
#define PROTOCOL_H

#include "resources/resource.h"

#include <string>
#include <vector>

namespace roomalloc {

struct AllocationRequest {
    std::string requester;
    std::string program;
    int term;
    int rooms_requested;
    int labs_requested;
    int min_capacity;      // 0 = any capacity

    AllocationRequest() : term(1), rooms_requested(0), labs_requested(0),
                          min_capacity(0) {}
};

enum class ResponseKind {
    SUCCESS,
    UNAVAILABLE,
    ERROR
};

struct AllocationResponse {
    ResponseKind kind;

    // SUCCESS
    std::string requester;
    std::string program;
    int term;
    std::vector<std::string> rooms_assigned;
    std::vector<std::string> labs_assigned;   // includes converted mobile rooms
    std::string notice;

    // UNAVAILABLE / ERROR
    std::string message;

    AllocationResponse() : kind(ResponseKind::ERROR), term(0) {}

    static AllocationResponse unavailable(const std::string& msg);
    static AllocationResponse error(const std::string& msg);
};

std::string response_kind_to_string(ResponseKind kind);

// Throws ValidationError with a message naming the offending field.
AllocationRequest parse_request(const std::string& json);
std::string to_json(const AllocationRequest& request);

std::string to_json(const AllocationResponse& response);
// Throws ProtocolError if the payload is not a JSON object.
AllocationResponse parse_response(const std::string& json);

// {"error": msg}
std::string error_payload(const std::string& message);

// true only for a single JSON object with nothing after it
bool is_valid_json(const std::string& payload);

// Best-effort "requester - program" label for log lines; empty when the
// payload is not a request.
std::string request_label(const std::string& payload);

std::string encode_snapshot(const std::vector<Resource>& resources);
// Throws ProtocolError on a malformed document or entry.
std::vector<Resource> decode_snapshot(const std::string& payload);

// "2026-10-19T14:32:15.123" in local time
std::string iso8601_now();

} // namespace roomalloc

#endif // PROTOCOL_H
