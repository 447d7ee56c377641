#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <chrono>
#include <cstring>

Libssh2Session::Libssh2Session(const SessionTarget& target)
    : target_(target),
      label_(fmt::format("{}@{}:{}", target.user, target.host, target.port)) {
}

Libssh2Session::~Libssh2Session() {
    close();
}

SSHStatus Libssh2Session::establish() {
    auto status = connect_socket();
    if (!status.ok()) return status;

    status = handshake();
    if (!status.ok()) {
        close();
        return status;
    }

    status = verify_host_key();
    if (!status.ok()) {
        close();
        return status;
    }

    status = authenticate();
    if (!status.ok()) {
        close();
        return status;
    }

    fanout_log(fmt::format("{}: session established", label_));
    return SSHStatus::Ok();
}

// ── TCP ──────────────────────────────────────────────────────

SSHStatus Libssh2Session::connect_socket() {
    platform::init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    // Name resolution cannot be interrupted; abort() takes effect once it returns.
    struct addrinfo* addrs = nullptr;
    std::string port = std::to_string(target_.port);
    int gai = getaddrinfo(target_.host.c_str(), port.c_str(), &hints, &addrs);
    if (gai != 0) {
        return fail(SSHErrc::RESOLVE_FAILED,
                    fmt::format("Failed to resolve host {}: {}", target_.host, gai_strerror(gai)));
    }
    if (aborted_) {
        freeaddrinfo(addrs);
        return fail(SSHErrc::ABORTED, "aborted");
    }

    std::string last_err = "no usable address";
    auto now = std::chrono::steady_clock::now();
    auto room = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - now);
    bool bounded = target_.connect_timeout.count() > 0 && target_.connect_timeout < room;
    auto deadline = bounded ? now + target_.connect_timeout : std::chrono::steady_clock::time_point::max();

    for (auto* ai = addrs; ai != nullptr; ai = ai->ai_next) {
        socket_t s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s == FANOUT_INVALID_SOCKET) {
            last_err = "Failed to create socket";
            continue;
        }
        platform::set_nonblocking(s);
        {
            std::lock_guard<std::mutex> lock(sock_mutex_);
            sock_ = s;
        }

        int ret = ::connect(s, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        int err = (ret == 0) ? 0 : errno;
        if (ret < 0 && err == EINPROGRESS) {
            // Wait for the non-blocking connect in short slices so abort() is noticed.
            err = ETIMEDOUT;
            while (!aborted_) {
                if (bounded && std::chrono::steady_clock::now() >= deadline) break;
                int revents = platform::poll_socket(s, POLLOUT, SOCKET_POLL_MS);
                if (revents != 0) {
                    err = platform::socket_error(s);
                    break;
                }
            }
        }

        if (err == 0 && !aborted_) {
            freeaddrinfo(addrs);
            int keepalive = 1;
            setsockopt(s, SOL_SOCKET, SO_KEEPALIVE,
                       reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));
            return SSHStatus::Ok();
        }

        {
            std::lock_guard<std::mutex> lock(sock_mutex_);
            platform::close_socket(sock_);
            sock_ = FANOUT_INVALID_SOCKET;
        }
        if (aborted_) break;
        last_err = (err == ETIMEDOUT) ? "Connection timed out" : platform::socket_error_string(err);
    }

    freeaddrinfo(addrs);
    return fail(SSHErrc::CONNECT_FAILED,
                fmt::format("Failed to connect to {}:{}: {}", target_.host, target_.port, last_err));
}

// ── SSH transport ────────────────────────────────────────────

SSHStatus Libssh2Session::handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail(SSHErrc::PROTOCOL_ERROR, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted during handshake");
    }
    if (rc != 0) {
        return fail(SSHErrc::PROTOCOL_ERROR, "SSH handshake failed: " + last_error());
    }

    // Keep long-running commands from being dropped by idle NAT/firewalls.
    libssh2_keepalive_config(session_, 1, 30);
    return SSHStatus::Ok();
}

SSHStatus Libssh2Session::verify_host_key() {
    if (!target_.strict_host_keys) return SSHStatus::Ok();

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return fail(SSHErrc::PROTOCOL_ERROR, "Server sent no host key");
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        return fail(SSHErrc::PROTOCOL_ERROR, "Failed to initialise known_hosts");
    }

    std::string path = target_.known_hosts.empty()
        ? (platform::home_dir() / ".ssh" / "known_hosts").string()
        : expand_tilde(target_.known_hosts);
    if (libssh2_knownhost_readfile(known, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(known);
        return fail(SSHErrc::HOST_KEY_REJECTED, "Cannot read known_hosts file " + path);
    }

    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(known, target_.host.c_str(), target_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &match);
    libssh2_knownhost_free(known);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return SSHStatus::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return fail(SSHErrc::HOST_KEY_REJECTED,
                    fmt::format("Host key for {} does not match {}", target_.host, path));
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return fail(SSHErrc::HOST_KEY_REJECTED,
                    fmt::format("No host key for {} in {}", target_.host, path));
    default:
        return fail(SSHErrc::HOST_KEY_REJECTED, "Host key check failed");
    }
}

// ── Waiting ──────────────────────────────────────────────────

bool Libssh2Session::wait_socket() {
    if (aborted_) return false;

    short events = 0;
    int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock_, events, SOCKET_POLL_MS);
    return !aborted_;
}

SSHStatus Libssh2Session::fail(SSHErrc code, const std::string& message) const {
    // Whatever broke after abort() is a consequence of the abort.
    if (aborted_) {
        return SSHStatus::Err(SSHErrc::ABORTED, "session aborted");
    }
    fanout_log(fmt::format("{}: {} ({})", label_, message, ssh_errc_name(code)));
    return SSHStatus::Err(code, message);
}

std::string Libssh2Session::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

// ── Teardown ─────────────────────────────────────────────────

void Libssh2Session::abort() {
    if (aborted_.exchange(true)) return;
    std::lock_guard<std::mutex> lock(sock_mutex_);
    platform::shutdown_socket(sock_);
    fanout_log(fmt::format("{}: abort requested", label_));
}

void Libssh2Session::close() {
    // After abort() the socket is shut down, so wait_socket() fails at once
    // and each goodbye below gets a single attempt.
    if (sftp_) {
        while (libssh2_sftp_shutdown(sftp_) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) break;
        }
        sftp_ = nullptr;
    }

    if (session_) {
        while (libssh2_session_disconnect(session_, "Normal disconnection") == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) break;
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ != FANOUT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = FANOUT_INVALID_SOCKET;
    }
}
