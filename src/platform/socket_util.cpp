#include "socket_util.hpp"
#include <cstring>
#include <mutex>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static std::once_flag once;
    std::call_once(once, [] {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
    });
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

int socket_error(socket_t sock) {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len) != 0) {
        return -1;
    }
    return err;
}

void shutdown_socket(socket_t sock) {
    if (sock == FANOUT_INVALID_SOCKET) return;
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

std::string socket_error_string(int err) {
#ifdef _WIN32
    return "socket error " + std::to_string(err);
#else
    return std::strerror(err);
#endif
}

} // namespace platform
