#include "session.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>

// ── Channels ─────────────────────────────────────────────────

LIBSSH2_CHANNEL* Libssh2Session::open_channel(SSHStatus& status) {
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            status = fail(SSHErrc::CHANNEL_ERROR, "Failed to open exec channel: " + last_error());
            return nullptr;
        }
        if (!wait_socket()) {
            status = fail(SSHErrc::ABORTED, "aborted opening channel");
            return nullptr;
        }
    }
    status = SSHStatus::Ok();
    return channel;
}

void Libssh2Session::free_channel(LIBSSH2_CHANNEL* channel) {
    if (!channel) return;
    while (libssh2_channel_free(channel) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
}

// ── Exec ─────────────────────────────────────────────────────

SSHStatus Libssh2Session::exec(const ExecRequest& request, SSHResult& result) {
    result = SSHResult{};
    if (!session_) {
        return fail(SSHErrc::CHANNEL_ERROR, "No session available for exec");
    }

    SSHStatus status;
    LIBSSH2_CHANNEL* channel = open_channel(status);
    if (!channel) return status;

    // Servers without a matching AcceptEnv refuse these; the command still runs.
    for (const auto& kv : request.env) {
        int rc;
        while ((rc = libssh2_channel_setenv_ex(
                    channel, kv.first.c_str(), static_cast<unsigned int>(kv.first.size()),
                    kv.second.c_str(), static_cast<unsigned int>(kv.second.size())))
               == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) break;
        }
        if (rc != 0 && !aborted_) {
            fanout_log(fmt::format("{}: server refused env {}", label_, kv.first));
        }
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, request.command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    if (rc != 0) {
        status = fail(SSHErrc::CHANNEL_ERROR, "Failed to exec command on channel: " + last_error());
        free_channel(channel);
        return status;
    }

    auto deliver = [&](StreamKind stream, const char* data, size_t len) {
        if (request.on_chunk) request.on_chunk(stream, data, len);
        if (request.keep_output) {
            (stream == StreamKind::STDOUT ? result.stdout_data : result.stderr_data).append(data, len);
        }
    };

    // Drain whatever one stream has buffered. Returns false on a read error.
    char buf[SSH_READ_BUF_SIZE];
    auto drain = [&](int stream_id, bool& progress) {
        StreamKind kind = stream_id == 0 ? StreamKind::STDOUT : StreamKind::STDERR;
        while (true) {
            ssize_t n = libssh2_channel_read_ex(channel, stream_id, buf, sizeof(buf));
            if (n > 0) {
                deliver(kind, buf, static_cast<size_t>(n));
                progress = true;
                continue;
            }
            return n == 0 || n == LIBSSH2_ERROR_EAGAIN;
        }
    };

    // Feed stdin while reading both streams, so a command that produces
    // output before consuming all its input cannot deadlock us.
    size_t sent = 0;
    bool eof_sent = false;
    while (true) {
        bool progress = false;

        if (!eof_sent && sent < request.input.size()) {
            ssize_t w = libssh2_channel_write(channel, request.input.data() + sent,
                                              request.input.size() - sent);
            if (w > 0) {
                sent += static_cast<size_t>(w);
                progress = true;
            } else if (w != LIBSSH2_ERROR_EAGAIN) {
                status = fail(SSHErrc::CHANNEL_ERROR, "Channel write error sending input: " + last_error());
                break;
            }
        }
        if (!eof_sent && sent >= request.input.size()) {
            int eof_rc = libssh2_channel_send_eof(channel);
            if (eof_rc == 0) {
                eof_sent = true;
                progress = true;
            } else if (eof_rc != LIBSSH2_ERROR_EAGAIN) {
                // Remote closed stdin early; keep reading its output.
                eof_sent = true;
            }
        }

        if (!drain(0, progress) || !drain(SSH_EXTENDED_DATA_STDERR, progress)) {
            status = fail(SSHErrc::CHANNEL_ERROR, "Channel read error: " + last_error());
            break;
        }

        if (libssh2_channel_eof(channel)) {
            bool tail = false;
            drain(0, tail);
            drain(SSH_EXTENDED_DATA_STDERR, tail);
            break;
        }

        if (!progress && !wait_socket()) {
            status = fail(SSHErrc::ABORTED, "aborted while command was running");
            break;
        }
    }

    if (!status.ok()) {
        free_channel(channel);
        return status;
    }

    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    while ((rc = libssh2_channel_wait_closed(channel)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    if (aborted_) {
        free_channel(channel);
        return fail(SSHErrc::ABORTED, "aborted while command was running");
    }

    result.exit_code = libssh2_channel_get_exit_status(channel);

    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal) {
        std::string name(signal, signal_len);
        libssh2_free(session_, signal);
        free_channel(channel);
        result.exit_code = -1;
        return fail(SSHErrc::REMOTE_SIGNAL, "Remote command killed by signal " + name);
    }

    free_channel(channel);
    return SSHStatus::Ok();
}
