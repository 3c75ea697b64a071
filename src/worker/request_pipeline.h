/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: request_pipeline.h

    Description:
        Request handling of an allocator worker as a composable function:

            payload ─► process_payload ─► [request log] ─► [table stats] ─► table
                            │
                            └─ error boundary: every exception becomes an
                               {"error": ...} reply

        A RequestHandler maps a validated request to a response. Logging and
        statistics are wrappers around a handler, so a test can run the bare
        table handler or a stub without them.
*******************************************************************************/

#ifndef REQUEST_PIPELINE_H
#define REQUEST_PIPELINE_H

#include "common/protocol.h"
#include "resources/resource_table.h"

#include <functional>
#include <string>

namespace roomalloc {

using RequestHandler = std::function<AllocationResponse(const AllocationRequest&)>;

RequestHandler make_table_handler(ResourceTable& table);

// Logs "requester - program" on arrival and the outcome with its latency.
RequestHandler with_request_logging(RequestHandler next);

// Logs the table occupancy after every successful allocation.
RequestHandler with_table_stats(RequestHandler next, const ResourceTable& table);

// Parses the payload, runs the handler and encodes the reply. Never throws:
//   ValidationError      -> {"error": <what>}
//   PersistenceError     -> {"error": "Failed to persist allocation"}
//   any other exception  -> {"error": "Internal error: <what>"}
std::string process_payload(const RequestHandler& handler, const std::string& payload);

} // namespace roomalloc

#endif // REQUEST_PIPELINE_H
