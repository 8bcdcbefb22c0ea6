#include "socket_util.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd = {sock, events, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    return ret > 0 ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(fmt::format("dial tcp {}:{}: lookup {}: {}",
                                                 host, port, host, gai_strerror(gai)));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == FLEETCMD_INVALID_SOCKET) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                last_error = "i/o timeout";
                close_socket(sock);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        freeaddrinfo(res);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("dial tcp {}:{}: {}", host, port, last_error));
}

} // namespace platform
