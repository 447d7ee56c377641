#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "remote.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_ATTRIBUTES LIBSSH2_SFTP_ATTRIBUTES;

// One SSH connection to one host, driven by libssh2 in non-blocking mode.
//
// Every blocking wait goes through wait_socket(), which polls in short
// slices and gives up once abort() has been called. abort() also shuts the
// socket down so a wait in progress wakes immediately.
class Libssh2Session : public RemoteSession {
public:
    explicit Libssh2Session(const SessionTarget& target);
    ~Libssh2Session() override;

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    SSHStatus establish() override;
    SSHStatus exec(const ExecRequest& request, SSHResult& result) override;
    SSHStatus put(const fs::path& local, const std::string& remote,
                  const TransferFlags& flags, std::string& written) override;
    SSHStatus get(const std::string& remote, const fs::path& local,
                  const TransferFlags& flags, std::string& written) override;
    void close() override;
    void abort() override;

    const std::string& label() const { return label_; }

private:
    SessionTarget target_;
    std::string label_;                 // user@host:port, for logs
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
    socket_t sock_ = FANOUT_INVALID_SOCKET;
    std::mutex sock_mutex_;             // guards sock_ against abort() from another thread
    std::atomic<bool> aborted_{false};

    // session.cpp
    SSHStatus connect_socket();
    SSHStatus handshake();
    SSHStatus verify_host_key();
    bool wait_socket();
    SSHStatus fail(SSHErrc code, const std::string& message) const;
    std::string last_error() const;

    // auth.cpp
    SSHStatus authenticate();
    bool auth_agent();
    bool auth_key_file(const std::string& private_key);
    bool auth_password();
    bool auth_keyboard_interactive();

    // connection.cpp
    LIBSSH2_CHANNEL* open_channel(SSHStatus& status);
    void free_channel(LIBSSH2_CHANNEL* channel);

    // sftp.cpp
    SSHStatus start_sftp();
    SSHStatus sftp_error(const std::string& what, const std::string& path) const;
    SSHStatus remote_stat(const std::string& path, LIBSSH2_SFTP_ATTRIBUTES& attrs, bool& exists);
    SSHStatus remote_mkdir(const std::string& path);
    SSHStatus remote_mkdir_p(const std::string& path);
    SSHStatus put_file(const fs::path& local, const std::string& remote);
    SSHStatus put_tree(const fs::path& local, const std::string& remote);
    SSHStatus get_file(const std::string& remote, const fs::path& local);
    SSHStatus get_tree(const std::string& remote, const fs::path& local);
};
