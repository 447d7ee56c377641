#include "transport.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <mutex>

// libssh2_init is not thread-safe and must run before any session exists.
static void init_libssh2_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        platform::init_networking();
        int rc = libssh2_init(0);
        if (rc != 0) {
            fanout_log(fmt::format("libssh2_init failed ({})", rc));
        } else {
            fanout_log(fmt::format("libssh2 {} initialised", libssh2_version(0)));
        }
    });
}

Libssh2Transport::Libssh2Transport() {
    init_libssh2_once();
}

std::unique_ptr<RemoteSession> Libssh2Transport::open(const SessionTarget& target) {
    return std::make_unique<Libssh2Session>(target);
}

SSHTransport& default_transport() {
    static Libssh2Transport transport;
    return transport;
}
