#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace wxdown::core::net {
// Owns one POSIX descriptor; move-only, closed on destruction.
class Descriptor {
public:
    Descriptor() = default;
    explicit Descriptor(int fd) : handle(fd) {}
    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;
    Descriptor(Descriptor&& other) noexcept : handle(other.handle) { other.handle = -1; }
    Descriptor& operator=(Descriptor&& other) noexcept;
    ~Descriptor() { close(); }

    bool valid() const { return handle >= 0; }
    int native() const { return handle; }
    void close();
    bool set_non_blocking(bool on = true);
    // poll() on the descriptor; false on timeout or error.
    bool wait_for(short events, int timeout_ms) const;
protected:
    int handle{-1};
};

// Connected TCP stream.
class Socket : public Descriptor {
public:
    Socket() = default;
    explicit Socket(int fd) : Descriptor(fd) {}
    // True when data (or EOF) is ready within timeout_ms.
    bool wait_readable(int timeout_ms) const;
    // Bytes read into buffer; nullopt on EOF or error.
    std::optional<int> recv_some(std::vector<char>& buffer);
    // Writes everything within timeout_ms in total; false on error or when the
    // peer stops reading for too long.
    bool send_all(std::string_view data, int timeout_ms = 5000);
};

// Listening IPv4 TCP socket. Port 0 asks the OS for an ephemeral port.
class Listener : public Descriptor {
public:
    bool open(uint16_t port, bool loopback_only = true);
    // Invalid socket when nobody is waiting. Accepted sockets are non-blocking.
    Socket accept();
    uint16_t local_port() const;
};
}
