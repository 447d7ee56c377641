#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

// ── The SSH capability ──────────────────────────────────────
// Everything the batch engine needs from an SSH implementation: open a
// session to one host, run a command or move a file, close. Each session is
// driven by a single worker thread; abort() is the one call that may come
// from another thread and makes any in-progress call return promptly.

// Capability-level failure codes. Operations map these to per-host error kinds.
enum class SSHErrc {
    OK,
    RESOLVE_FAILED,      // host name did not resolve
    CONNECT_FAILED,      // TCP connect refused, unreachable or timed out
    HOST_KEY_REJECTED,   // server key missing from or mismatching known_hosts
    AUTH_REJECTED,       // no authentication method succeeded
    PROTOCOL_ERROR,      // SSH handshake or transport failure
    CHANNEL_ERROR,       // channel could not be opened, or dropped mid-stream
    REMOTE_SIGNAL,       // remote command was killed by a signal
    LOCAL_IO,            // local file could not be read or written
    REMOTE_IO,           // remote file could not be read or written
    SIZE_MISMATCH,       // bytes transferred differ from the source size
    ABORTED,             // abort() was called
};

const char* ssh_errc_name(SSHErrc code);

struct SSHStatus {
    SSHErrc code = SSHErrc::OK;
    std::string message;

    bool ok() const { return code == SSHErrc::OK; }

    static SSHStatus Ok() { return {SSHErrc::OK, ""}; }
    static SSHStatus Err(SSHErrc code, std::string message) {
        return {code, std::move(message)};
    }
};

// Where and how to connect.
struct SessionTarget {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    bool use_agent = true;
    bool strict_host_keys = false;
    std::string known_hosts;                    // empty = ~/.ssh/known_hosts
    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT_SECS * 1000};
};

using ChunkCallback = std::function<void(StreamKind stream, const char* data, size_t len)>;

struct ExecRequest {
    std::string command;
    std::string input;                                       // written to stdin, then EOF
    std::vector<std::pair<std::string, std::string>> env;    // requested via setenv, refusals are not fatal
    ChunkCallback on_chunk;                                  // every chunk as it arrives
    bool keep_output = true;                                 // also accumulate into the result buffers
};

struct TransferFlags {
    bool recursive = false;     // allow directory trees
    bool create_dirs = false;   // create missing parent directories at the destination
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Connect, verify and authenticate.
    virtual SSHStatus establish() = 0;

    // Run a command to completion. result carries the exit status and any
    // output captured so far, even on failure.
    virtual SSHStatus exec(const ExecRequest& request, SSHResult& result) = 0;

    // Copy local -> remote. written is the remote path actually written
    // (remote/<name> when remote is an existing directory).
    virtual SSHStatus put(const fs::path& local, const std::string& remote,
                          const TransferFlags& flags, std::string& written) = 0;

    // Copy remote -> local. written is the local path actually written.
    virtual SSHStatus get(const std::string& remote, const fs::path& local,
                          const TransferFlags& flags, std::string& written) = 0;

    virtual void close() = 0;

    // Force the current (or next) call to return with SSHErrc::ABORTED.
    // Idempotent and safe to call from any thread.
    virtual void abort() = 0;
};

class SSHTransport {
public:
    virtual ~SSHTransport() = default;

    // Create an unconnected session for target. establish() connects it.
    virtual std::unique_ptr<RemoteSession> open(const SessionTarget& target) = 0;
};
