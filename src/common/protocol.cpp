/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: protocol.cpp

    Description:
        JsonCpp-backed encoding of requests, responses and table snapshots.
        Output is compact (no indentation) so a document always fits in one
        frame line of the logs.
*******************************************************************************/

#include "common/protocol.h"
#include "common/errors.h"

#include <json/json.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace roomalloc {

namespace {

bool parse_json(const std::string& text, Json::Value& root, std::string& errors) {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}

std::string write_json(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

std::string require_string(const Json::Value& root, const char* field) {
    const Json::Value& value = root[field];
    if (!value.isString() || value.asString().empty()) {
        throw ValidationError(std::string("Field '") + field +
                              "' must be a non-empty string");
    }
    std::string text = value.asString();
    for (char c : text) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            throw ValidationError(std::string("Field '") + field +
                                  "' must not contain control characters");
        }
    }
    return text;
}

int require_int(const Json::Value& root, const char* field, int min_value) {
    const Json::Value& value = root[field];
    if (value.isNull()) {
        throw ValidationError(std::string("Missing field '") + field + "'");
    }
    if (!value.isInt() || value.isBool()) {
        throw ValidationError(std::string("Field '") + field + "' must be an integer");
    }
    int result = value.asInt();
    if (result < min_value) {
        throw ValidationError(std::string("Field '") + field + "' must be >= " +
                              std::to_string(min_value));
    }
    return result;
}

Json::Value id_array(const std::vector<std::string>& ids) {
    Json::Value array(Json::arrayValue);
    for (const auto& id : ids) {
        array.append(id);
    }
    return array;
}

std::vector<std::string> read_id_array(const Json::Value& array) {
    std::vector<std::string> ids;
    if (!array.isArray()) {
        return ids;
    }
    for (const auto& item : array) {
        ids.push_back(item.asString());
    }
    return ids;
}

std::string optional_string(const Json::Value& entry, const char* field) {
    const Json::Value& value = entry[field];
    if (value.isNull()) return "";
    if (!value.isString()) {
        throw ProtocolError(std::string("Snapshot field '") + field +
                            "' must be a string");
    }
    return value.asString();
}

} // namespace

AllocationResponse AllocationResponse::unavailable(const std::string& msg) {
    AllocationResponse response;
    response.kind = ResponseKind::UNAVAILABLE;
    response.message = msg;
    return response;
}

AllocationResponse AllocationResponse::error(const std::string& msg) {
    AllocationResponse response;
    response.kind = ResponseKind::ERROR;
    response.message = msg;
    return response;
}

std::string response_kind_to_string(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::SUCCESS: return "SUCCESS";
        case ResponseKind::UNAVAILABLE: return "UNAVAILABLE";
        case ResponseKind::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

//==============================================================================
// Requests
//==============================================================================

AllocationRequest parse_request(const std::string& json) {
    Json::Value root;
    std::string errors;
    if (!parse_json(json, root, errors)) {
        throw ValidationError("Malformed request JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ValidationError("Request must be a JSON object");
    }

    AllocationRequest request;
    request.requester = require_string(root, "requester");
    request.program = require_string(root, "program");
    request.term = require_int(root, "term", 1);
    request.rooms_requested = require_int(root, "rooms_requested", 0);
    request.labs_requested = require_int(root, "labs_requested", 0);
    if (root.isMember("min_capacity") && !root["min_capacity"].isNull()) {
        request.min_capacity = require_int(root, "min_capacity", 0);
    }

    if (request.rooms_requested == 0 && request.labs_requested == 0) {
        throw ValidationError("Request must ask for at least one room or lab");
    }
    return request;
}

std::string to_json(const AllocationRequest& request) {
    Json::Value root(Json::objectValue);
    root["requester"] = request.requester;
    root["program"] = request.program;
    root["term"] = request.term;
    root["rooms_requested"] = request.rooms_requested;
    root["labs_requested"] = request.labs_requested;
    if (request.min_capacity > 0) {
        root["min_capacity"] = request.min_capacity;
    }
    return write_json(root);
}

//==============================================================================
// Responses
//==============================================================================

std::string to_json(const AllocationResponse& response) {
    Json::Value root(Json::objectValue);
    switch (response.kind) {
        case ResponseKind::SUCCESS:
            root["requester"] = response.requester;
            root["program"] = response.program;
            root["term"] = response.term;
            root["rooms_assigned"] = id_array(response.rooms_assigned);
            root["labs_assigned"] = id_array(response.labs_assigned);
            if (!response.notice.empty()) {
                root["notice"] = response.notice;
            }
            break;
        case ResponseKind::UNAVAILABLE:
            root["unavailable"] = response.message;
            break;
        case ResponseKind::ERROR:
            root["error"] = response.message;
            break;
    }
    return write_json(root);
}

AllocationResponse parse_response(const std::string& json) {
    Json::Value root;
    std::string errors;
    if (!parse_json(json, root, errors) || !root.isObject()) {
        throw ProtocolError("Reply is not a JSON object");
    }

    if (root.isMember("unavailable")) {
        return AllocationResponse::unavailable(root["unavailable"].asString());
    }
    if (root.isMember("error")) {
        return AllocationResponse::error(root["error"].asString());
    }

    AllocationResponse response;
    response.kind = ResponseKind::SUCCESS;
    response.requester = root["requester"].asString();
    response.program = root["program"].asString();
    response.term = root["term"].isInt() ? root["term"].asInt() : 0;
    response.rooms_assigned = read_id_array(root["rooms_assigned"]);
    response.labs_assigned = read_id_array(root["labs_assigned"]);
    response.notice = root.get("notice", "").asString();
    return response;
}

std::string error_payload(const std::string& message) {
    Json::Value root(Json::objectValue);
    root["error"] = message;
    return write_json(root);
}

bool is_valid_json(const std::string& payload) {
    Json::Value root;
    std::string errors;
    return parse_json(payload, root, errors) && root.isObject();
}

std::string request_label(const std::string& payload) {
    Json::Value root;
    std::string errors;
    if (!parse_json(payload, root, errors) || !root.isObject()) {
        return "";
    }
    if (!root["requester"].isString() || !root["program"].isString()) {
        return "";
    }
    return root["requester"].asString() + " - " + root["program"].asString();
}

//==============================================================================
// Snapshots
//==============================================================================

std::string encode_snapshot(const std::vector<Resource>& resources) {
    Json::Value table(Json::objectValue);
    for (const auto& r : resources) {
        Json::Value entry(Json::objectValue);
        entry["id"] = r.id;
        entry["kind"] = kind_to_string(r.kind);
        entry["status"] = status_to_string(r.status);
        entry["capacity"] = r.capacity;
        entry["requester"] = r.requester;
        entry["program"] = r.program;
        entry["requested_at"] = r.requested_at;
        entry["assigned_at"] = r.assigned_at;
        table[r.id] = entry;
    }

    Json::Value root(Json::objectValue);
    root["resources"] = table;
    return write_json(root);
}

std::vector<Resource> decode_snapshot(const std::string& payload) {
    Json::Value root;
    std::string errors;
    if (!parse_json(payload, root, errors)) {
        throw ProtocolError("Snapshot is not valid JSON: " + errors);
    }
    if (!root.isObject() || !root["resources"].isObject()) {
        throw ProtocolError("Snapshot is missing the 'resources' object");
    }

    std::vector<Resource> resources;
    const Json::Value& table = root["resources"];
    for (const auto& key : table.getMemberNames()) {
        const Json::Value& entry = table[key];
        if (!entry.isObject()) {
            throw ProtocolError("Snapshot entry '" + key + "' is not an object");
        }

        Resource r;
        r.id = entry.isMember("id") ? optional_string(entry, "id") : key;
        if (r.id != key) {
            throw ProtocolError("Snapshot entry '" + key + "' carries id '" + r.id + "'");
        }
        if (!entry["capacity"].isInt()) {
            throw ProtocolError("Snapshot entry '" + key + "' has no integer capacity");
        }
        r.capacity = entry["capacity"].asInt();
        r.requester = optional_string(entry, "requester");
        r.program = optional_string(entry, "program");
        r.requested_at = optional_string(entry, "requested_at");
        r.assigned_at = optional_string(entry, "assigned_at");

        try {
            r.kind = kind_from_string(optional_string(entry, "kind"));
            r.status = status_from_string(optional_string(entry, "status"));
        } catch (const ValidationError& e) {
            throw ProtocolError("Snapshot entry '" + key + "': " + e.what());
        }

        if (!r.is_consistent()) {
            throw ProtocolError("Snapshot entry '" + key + "' is inconsistent");
        }
        resources.push_back(r);
    }
    return resources;
}

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm;
    localtime_r(&time, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace roomalloc
