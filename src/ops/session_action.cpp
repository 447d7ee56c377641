#include "session_action.hpp"
#include <core/utils.hpp>

ErrorKind classify(SSHErrc code, SessionPhase phase) {
    switch (code) {
    case SSHErrc::RESOLVE_FAILED:
        return ErrorKind::UNKNOWN_HOST;
    case SSHErrc::CONNECT_FAILED:
    case SSHErrc::HOST_KEY_REJECTED:
        return ErrorKind::CONNECTION;
    case SSHErrc::AUTH_REJECTED:
        return ErrorKind::AUTHENTICATION;
    case SSHErrc::PROTOCOL_ERROR:
    case SSHErrc::CHANNEL_ERROR:
        if (phase == SessionPhase::CONNECT) return ErrorKind::CONNECTION;
        return phase == SessionPhase::TRANSFER ? ErrorKind::TRANSFER : ErrorKind::EXECUTION;
    case SSHErrc::REMOTE_SIGNAL:
        return ErrorKind::EXECUTION;
    case SSHErrc::LOCAL_IO:
    case SSHErrc::REMOTE_IO:
    case SSHErrc::SIZE_MISMATCH:
        return phase == SessionPhase::EXEC ? ErrorKind::EXECUTION : ErrorKind::TRANSFER;
    case SSHErrc::ABORTED:
        return ErrorKind::CANCELLED;
    case SSHErrc::OK:
        break;
    }
    return ErrorKind::EXECUTION;
}

HostError make_error(const Task& task, const SSHStatus& status, SessionPhase phase,
                     std::string detail) {
    return HostError{task.key, classify(status.code, phase), status.message, std::move(detail)};
}

SessionTarget make_target(const Task& task, const Options& options) {
    SessionTarget target;
    target.host = task.host.host;
    target.port = task.host.port.value_or(options.port);
    if (task.host.user) {
        target.user = *task.host.user;
    } else if (!options.user.empty()) {
        target.user = options.user;
    } else {
        target.user = local_username();
    }
    target.key_path = task.host.key_path ? task.host.key_path : options.key_path;
    target.password = options.password;
    target.use_agent = options.use_agent;
    target.strict_host_keys = options.strict_host_keys;
    target.known_hosts = options.known_hosts;
    target.connect_timeout = options.connect_timeout;
    return target;
}

AbortOnCancel::AbortOnCancel(CancelToken token, RemoteSession& session)
    : token_(std::move(token)) {
    RemoteSession* s = &session;
    hook_ = token_.subscribe([s] { s->abort(); });
}

AbortOnCancel::~AbortOnCancel() {
    if (hook_ != 0) token_.unsubscribe(hook_);
}
