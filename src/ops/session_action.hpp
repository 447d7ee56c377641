#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <dispatch/host_result.hpp>
#include <dispatch/task.hpp>
#include <dispatch/worker_pool.hpp>
#include <ssh/remote.hpp>
#include "options.hpp"

// Where in a session's life a failure happened. The same capability code
// can mean different things: a dropped channel while connecting is a
// connection problem, while running a command it is an execution problem.
enum class SessionPhase {
    CONNECT,
    EXEC,
    TRANSFER,
};

ErrorKind classify(SSHErrc code, SessionPhase phase);

HostError make_error(const Task& task, const SSHStatus& status, SessionPhase phase,
                     std::string detail = "");

// Connection parameters for one host: per-host user, port and key win over
// the batch options, which win over the local login name and port 22.
SessionTarget make_target(const Task& task, const Options& options);

// Ties a session's abort() to a cancellation token for as long as it lives.
class AbortOnCancel {
public:
    AbortOnCancel(CancelToken token, RemoteSession& session);
    ~AbortOnCancel();

    AbortOnCancel(const AbortOnCancel&) = delete;
    AbortOnCancel& operator=(const AbortOnCancel&) = delete;

private:
    CancelToken token_;
    uint64_t hook_;
};

// Closes a session when it goes out of scope. Declared after the
// AbortOnCancel guard so the close itself can still be aborted.
class CloseOnExit {
public:
    explicit CloseOnExit(RemoteSession& session) : session_(session) {}
    ~CloseOnExit() { session_.close(); }

    CloseOnExit(const CloseOnExit&) = delete;
    CloseOnExit& operator=(const CloseOnExit&) = delete;

private:
    RemoteSession& session_;
};

template <typename T>
using SessionBody = std::function<HostResult<T>(RemoteSession& session)>;

// Open and establish a session to the task's host, run body on it, close.
// ctx.token() aborts the session from the pool's side, up to and including
// the close.
template <typename T>
HostResult<T> run_session_action(SSHTransport& transport, const Task& task,
                                 const Options& options, TaskContext& ctx,
                                 const SessionBody<T>& body) {
    std::unique_ptr<RemoteSession> session = transport.open(make_target(task, options));
    AbortOnCancel guard(ctx.token(), *session);
    CloseOnExit closer(*session);

    SSHStatus status = session->establish();
    if (!status.ok()) {
        return HostResult<T>::Err(make_error(task, status, SessionPhase::CONNECT));
    }
    return body(*session);
}
