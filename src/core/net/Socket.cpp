#include "wxdown/core/net/Socket.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <chrono>

namespace wxdown::core::net {
Descriptor& Descriptor::operator=(Descriptor&& other) noexcept {
    if (this != &other) {
        close();
        handle = other.handle;
        other.handle = -1;
    }
    return *this;
}

void Descriptor::close() {
    if (handle >= 0) { ::close(handle); handle = -1; }
}

bool Descriptor::set_non_blocking(bool on) {
    if (!valid()) return false;
    int flags = ::fcntl(handle, F_GETFL, 0);
    if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(handle, F_SETFL, flags) == 0;
}

bool Descriptor::wait_for(short events, int timeout_ms) const {
    if (!valid()) return false;
    pollfd pfd{ handle, events, 0 };
    int r;
    do { r = ::poll(&pfd, 1, timeout_ms); } while (r < 0 && errno == EINTR);
    return r > 0;
}

bool Socket::wait_readable(int timeout_ms) const { return wait_for(POLLIN, timeout_ms); }

std::optional<int> Socket::recv_some(std::vector<char>& buffer) {
    if (!valid() || buffer.empty()) return std::nullopt;
    ssize_t r;
    do { r = ::recv(handle, buffer.data(), buffer.size(), 0); } while (r < 0 && errno == EINTR);
    if (r <= 0) return std::nullopt;
    return static_cast<int>(r);
}

bool Socket::send_all(std::string_view data, int timeout_ms) {
    if (!valid()) return false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!data.empty()) {
        ssize_t sent = ::send(handle, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) return false;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0 || !wait_for(POLLOUT, static_cast<int>(left))) return false;
            continue;
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

bool Listener::open(uint16_t port, bool loopback_only) {
    if (valid()) return false;
    handle = ::socket(AF_INET, SOCK_STREAM, 0);
    if (handle < 0) return false;
    int yes = 1;
    ::setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(loopback_only ? INADDR_LOOPBACK : INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(handle, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(handle, 128) < 0) {
        close();
        return false;
    }
    return set_non_blocking();
}

uint16_t Listener::local_port() const {
    if (!valid()) return 0;
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    if (::getsockname(handle, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

Socket Listener::accept() {
    if (!valid()) return Socket();
    int c;
    do { c = ::accept(handle, nullptr, nullptr); } while (c < 0 && errno == EINTR);
    // Linux does not pass O_NONBLOCK on to accepted sockets.
    Socket s(c);
    if (s.valid() && !s.set_non_blocking()) return Socket();
    return s;
}
}
