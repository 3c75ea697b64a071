/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: errors.h

    Description:
        Exception types used inside the service. They never cross a process
        boundary: the request-handling boundary in the allocator worker turns
        them into {"error": ...} payloads, and the submission client turns
        CommunicationError into a retryable failure for its caller.

        Taxonomy:
        - ValidationError:    missing or malformed request fields
        - ProtocolError:      bytes that do not decode as a multipart frame or
                              as the expected JSON document
        - PersistenceError:   the durable resource file could not be read or
                              rewritten
        - CommunicationError: send/receive deadline expired or the peer
                              connection is gone (retryable)

        Resource shortage is not an exception. It is an ordinary response
        kind (ResponseKind::UNAVAILABLE, see common/protocol.h).
*******************************************************************************/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace roomalloc {

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what)
        : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what)
        : std::runtime_error(what) {}
};

class CommunicationError : public std::runtime_error {
public:
    CommunicationError(const std::string& what, bool timed_out)
        : std::runtime_error(what), timed_out_(timed_out) {}

    // True when a deadline expired (as opposed to a broken connection).
    bool timed_out() const { return timed_out_; }

    // Both deadline expiry and a lost connection can be retried by the caller.
    bool retryable() const { return true; }

private:
    bool timed_out_;
};

} // namespace roomalloc

#endif // ERRORS_H
