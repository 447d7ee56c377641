#pragma once

#include <string>

// Why one host's task failed. Never fatal to the rest of the batch.
enum class ErrorKind {
    CONNECTION,       // could not reach or establish a session (refused, unreachable)
    AUTHENTICATION,   // credentials rejected
    TIMEOUT,          // per-host deadline passed before completion
    EXECUTION,        // session-level failure below the exit status (channel dropped, killed by signal)
    TRANSFER,         // file push/pull failed (local or remote I/O, size mismatch)
    CANCELLED,        // batch aborted before this host started or finished
    UNKNOWN_HOST,     // name could not be resolved to an address
};

const char* error_kind_name(ErrorKind kind);

struct HostError {
    std::string host;       // result key of the failed host
    ErrorKind kind;
    std::string message;
    std::string detail;     // remote stderr captured before the failure, if any

    std::string what() const;
};
