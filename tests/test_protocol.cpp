/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: test_protocol.cpp

    Description:
        Tests for the wire layer: multipart framing (including partial and
        corrupt buffers) and the JSON request/response/snapshot documents.
*******************************************************************************/

#include "common/message.h"
#include "common/protocol.h"
#include "common/errors.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <climits>

using namespace roomalloc;

template <typename Fn>
static bool throws_validation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

template <typename Fn>
static bool throws_protocol(Fn fn) {
    try {
        fn();
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    std::cout << "Running protocol tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Multipart framing with empty frames... ";
        try {
            Multipart frames = make_worker_envelope("peer-7", "{\"a\":1}");
            auto wire = serialize_message(frames);
            // prefix + count + 3 lengths + payload bytes
            assert(wire.size() == 4 + 4 + 3 * 4 + 6 + 0 + 7);

            std::vector<uint8_t> buffer(wire.begin(), wire.end());
            Multipart out;
            assert(extract_message(buffer, out));
            assert(out == frames);
            assert(out[1].empty());
            assert(buffer.empty());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Partial and back-to-back messages... ";
        try {
            auto first = serialize_message(Multipart{READY_SIGNAL});
            auto second = serialize_message(make_client_envelope("{}"));

            std::vector<uint8_t> stream(first.begin(), first.end());
            stream.insert(stream.end(), second.begin(), second.end());

            // Feed everything but the last byte
            std::vector<uint8_t> buffer(stream.begin(), stream.end() - 1);
            Multipart out;
            assert(extract_message(buffer, out));
            assert(is_ready_signal(out));
            assert(!extract_message(buffer, out));

            buffer.push_back(stream.back());
            assert(extract_message(buffer, out));
            assert(out.size() == 2 && out[0].empty() && out[1] == "{}");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Corrupt frames raise ProtocolError... ";
        try {
            // Frame length larger than the body
            std::vector<uint8_t> body = {0, 0, 0, 1, 0, 0, 0, 50, 'x'};
            assert(throws_protocol([&]() { deserialize_body(body.data(), body.size()); }));

            // Trailing garbage after the last frame
            std::vector<uint8_t> trailing = {0, 0, 0, 1, 0, 0, 0, 1, 'x', 'y'};
            assert(throws_protocol([&]() { deserialize_body(trailing.data(), trailing.size()); }));

            // Oversized length prefix
            std::vector<uint8_t> huge = {0x7f, 0xff, 0xff, 0xff, 0, 0, 0, 0};
            Multipart out;
            assert(throws_protocol([&]() { extract_message(huge, out); }));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Request parsing and validation... ";
        try {
            auto request = parse_request(
                "{\"requester\":\"Engineering\",\"program\":\"Systems\",\"term\":2,"
                "\"rooms_requested\":3,\"labs_requested\":2}");
            assert(request.requester == "Engineering");
            assert(request.term == 2);
            assert(request.rooms_requested == 3);
            assert(request.labs_requested == 2);
            assert(request.min_capacity == 0);

            auto again = parse_request(to_json(request));
            assert(again.program == "Systems" && again.labs_requested == 2);

            assert(throws_validation([]() { parse_request("not json"); }));
            assert(throws_validation([]() { parse_request("[1,2]"); }));
            assert(throws_validation([]() {
                parse_request("{\"program\":\"P\",\"term\":1,\"rooms_requested\":1,\"labs_requested\":0}");
            }));
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                              "\"rooms_requested\":\"3\",\"labs_requested\":0}");
            }));
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                              "\"rooms_requested\":-1,\"labs_requested\":2}");
            }));
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                              "\"rooms_requested\":0,\"labs_requested\":0}");
            }));
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"P\",\"term\":0,"
                              "\"rooms_requested\":1,\"labs_requested\":0}");
            }));

            // The largest counts are accepted without overflowing the emptiness check
            auto huge = parse_request(
                "{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                "\"rooms_requested\":" + std::to_string(INT_MAX) + ",\"labs_requested\":1}");
            assert(huge.rooms_requested == INT_MAX);
            assert(huge.labs_requested == 1);
            auto huge_labs = parse_request(
                "{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                "\"rooms_requested\":0,\"labs_requested\":" + std::to_string(INT_MAX) + "}");
            assert(huge_labs.labs_requested == INT_MAX);

            // Text fields end up in CSV rows and log lines
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"Eng\\nineering\",\"program\":\"P\",\"term\":1,"
                              "\"rooms_requested\":1,\"labs_requested\":0}");
            }));
            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"Sys\\ttems\",\"term\":1,"
                              "\"rooms_requested\":1,\"labs_requested\":0}");
            }));
            auto padded = parse_request(
                "{\"requester\":\"  Engineering \",\"program\":\"Systems, Networks\",\"term\":1,"
                "\"rooms_requested\":1,\"labs_requested\":0}");
            assert(padded.requester == "  Engineering ");
            assert(padded.program == "Systems, Networks");

            assert(throws_validation([]() {
                parse_request("{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                              "\"rooms_requested\":1,\"labs_requested\":0} trailing");
            }));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Response kinds keep distinct shapes... ";
        try {
            AllocationResponse success;
            success.kind = ResponseKind::SUCCESS;
            success.requester = "Engineering";
            success.program = "Systems";
            success.term = 1;
            success.rooms_assigned = {"S1", "S2"};
            success.labs_assigned = {"S3"};
            success.notice = "Converted 1 room into mobile rooms due to lab shortage";

            auto parsed = parse_response(to_json(success));
            assert(parsed.kind == ResponseKind::SUCCESS);
            assert(parsed.rooms_assigned.size() == 2);
            assert(parsed.labs_assigned[0] == "S3");
            assert(parsed.notice == success.notice);

            auto unavailable = parse_response(to_json(AllocationResponse::unavailable("no rooms")));
            assert(unavailable.kind == ResponseKind::UNAVAILABLE);
            assert(unavailable.message == "no rooms");

            auto error = parse_response(error_payload("bad request"));
            assert(error.kind == ResponseKind::ERROR);
            assert(error.message == "bad request");

            assert(is_valid_json(error_payload("x")));
            assert(!is_valid_json("{broken"));
            assert(!is_valid_json("{\"error\":\"x\"} <html>garbage</html>"));
            assert(!is_valid_json("{\"error\":\"x\"}{\"error\":\"y\"}"));
            assert(!is_valid_json("[1,2]"));
            assert(!is_valid_json("42"));
            assert(is_valid_json("{\"error\":\"x\"}\n"));
            assert(throws_protocol([]() { parse_response("{broken"); }));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Snapshot encode/decode... ";
        try {
            Resource room("S1", ResourceKind::FIXED_ROOM, 40);
            Resource mobile("S2", ResourceKind::MOBILE_ROOM, 30);
            mobile.assign("Engineering", "Systems", "2026-10-19T10:00:00.000");

            std::string payload = encode_snapshot({room, mobile});
            auto rows = decode_snapshot(payload);
            assert(rows.size() == 2);
            bool saw_mobile = false;
            for (const auto& r : rows) {
                if (r.id == "S2") {
                    assert(r == mobile);
                    saw_mobile = true;
                } else {
                    assert(r == room);
                }
            }
            assert(saw_mobile);

            assert(decode_snapshot("{\"resources\":{}}").empty());
            assert(throws_protocol([]() { decode_snapshot("{\"rooms\":{}}"); }));
            assert(throws_protocol([]() {
                decode_snapshot("{\"resources\":{\"S1\":{\"id\":\"S1\",\"kind\":\"gym\","
                                "\"status\":\"available\",\"capacity\":10}}}");
            }));
            assert(throws_protocol([]() {
                decode_snapshot("{\"resources\":{\"S1\":{\"id\":\"S1\",\"kind\":\"room\","
                                "\"status\":\"assigned\",\"capacity\":10}}}");
            }));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Request label for log lines... ";
        try {
            assert(request_label("{\"requester\":\"Sciences\",\"program\":\"Biology\"}") ==
                   "Sciences - Biology");
            assert(request_label("garbage").empty());
            assert(iso8601_now().size() == 23);
            assert(iso8601_now()[10] == 'T');
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
