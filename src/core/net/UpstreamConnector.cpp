#include "wxdown/core/net/UpstreamConnector.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>

namespace wxdown::core::net {
namespace {
struct AddrInfoDeleter { void operator()(addrinfo* p) const { ::freeaddrinfo(p); } };
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Non-blocking connect bounded by timeout_ms; the socket is returned in blocking mode.
std::optional<Socket> connect_one(const addrinfo& ai, int timeout_ms, int& last_error) {
    Socket sock(::socket(ai.ai_family, ai.ai_socktype, ai.ai_protocol));
    if (!sock.valid()) { last_error = errno; return std::nullopt; }
    sock.set_non_blocking(true);
    if (::connect(sock.native(), ai.ai_addr, ai.ai_addrlen) < 0) {
        if (errno != EINPROGRESS) { last_error = errno; return std::nullopt; }
        if (!sock.wait_for(POLLOUT, timeout_ms)) { last_error = ETIMEDOUT; return std::nullopt; }
        int so_error = 0; socklen_t len = sizeof(so_error);
        if (::getsockopt(sock.native(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            last_error = so_error ? so_error : errno;
            return std::nullopt;
        }
    }
    sock.set_non_blocking(false);
    return std::optional<Socket>(std::move(sock));
}
}

std::optional<Socket> UpstreamConnector::connect(const std::string& host, uint16_t port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* raw = nullptr;
    int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw);
    if (gai != 0) {
        util::log_debug(fmt::format("resolve {} failed: {}", host, ::gai_strerror(gai)));
        return std::nullopt;
    }
    AddrInfoPtr list(raw);
    int last_error = 0;
    for (auto p = list.get(); p; p = p->ai_next) {
        if (auto sock = connect_one(*p, timeout_ms, last_error)) return sock;
    }
    util::log_debug(fmt::format("connect {}:{} failed: {}", host, port, std::strerror(last_error)));
    return std::nullopt;
}
}
