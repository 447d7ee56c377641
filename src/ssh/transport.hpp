#pragma once

#include <memory>
#include "remote.hpp"

// SSHTransport backed by libssh2. Sessions are independent; each one owns
// its own socket, so any number may run on different threads at once.
class Libssh2Transport : public SSHTransport {
public:
    Libssh2Transport();

    std::unique_ptr<RemoteSession> open(const SessionTarget& target) override;
};

// Process-wide libssh2 transport used when callers don't supply one.
SSHTransport& default_transport();
