/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: request_pipeline.cpp
*******************************************************************************/

#include "worker/request_pipeline.h"
#include "common/errors.h"
#include "common/logger.h"

#include <chrono>

namespace roomalloc {

RequestHandler make_table_handler(ResourceTable& table) {
    return [&table](const AllocationRequest& request) {
        return table.allocate(request);
    };
}

RequestHandler with_request_logging(RequestHandler next) {
    return [next](const AllocationRequest& request) {
        std::string label = request.requester + " - " + request.program;
        Logger::info("Processing request " + label + " (term " +
                     std::to_string(request.term) + ": " +
                     std::to_string(request.rooms_requested) + " rooms, " +
                     std::to_string(request.labs_requested) + " labs)");

        auto start = std::chrono::steady_clock::now();
        AllocationResponse response = next(request);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        Logger::info("Request " + label + " finished: " +
                     response_kind_to_string(response.kind) + " in " +
                     std::to_string(elapsed) + " ms");
        return response;
    };
}

RequestHandler with_table_stats(RequestHandler next, const ResourceTable& table) {
    return [next, &table](const AllocationRequest& request) {
        AllocationResponse response = next(request);
        if (response.kind == ResponseKind::SUCCESS) {
            Logger::info("Table: " + table.stats().to_string());
        }
        return response;
    };
}

std::string process_payload(const RequestHandler& handler, const std::string& payload) {
    try {
        AllocationRequest request = parse_request(payload);
        return to_json(handler(request));
    } catch (const ValidationError& e) {
        Logger::warning(std::string("Rejected request: ") + e.what());
        return to_json(AllocationResponse::error(e.what()));
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Persistence failure: ") + e.what());
        return to_json(AllocationResponse::error("Failed to persist allocation"));
    } catch (const std::exception& e) {
        Logger::error(std::string("Request failed: ") + e.what());
        return to_json(AllocationResponse::error(std::string("Internal error: ") + e.what()));
    }
}

} // namespace roomalloc
