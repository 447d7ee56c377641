#include "remote.hpp"

const char* ssh_errc_name(SSHErrc code) {
    switch (code) {
    case SSHErrc::OK:                return "ok";
    case SSHErrc::RESOLVE_FAILED:    return "resolve failed";
    case SSHErrc::CONNECT_FAILED:    return "connect failed";
    case SSHErrc::HOST_KEY_REJECTED: return "host key rejected";
    case SSHErrc::AUTH_REJECTED:     return "auth rejected";
    case SSHErrc::PROTOCOL_ERROR:    return "protocol error";
    case SSHErrc::CHANNEL_ERROR:     return "channel error";
    case SSHErrc::REMOTE_SIGNAL:     return "remote signal";
    case SSHErrc::LOCAL_IO:          return "local I/O error";
    case SSHErrc::REMOTE_IO:         return "remote I/O error";
    case SSHErrc::SIZE_MISMATCH:     return "size mismatch";
    case SSHErrc::ABORTED:           return "aborted";
    }
    return "?";
}
