#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>

namespace wxdown::core::http {
struct Endpoint {
    std::string host;
    uint16_t port{80};
    std::string to_string() const;
};
bool operator==(const Endpoint& a, const Endpoint& b);

// Accepts "host", "host:port", "[v6]:port" and "scheme://host:port/...".
std::optional<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port = 80);

struct HostTarget {
    Endpoint endpoint;
    std::string path;
};
// Splits an absolute http URL into endpoint and origin-form path.
std::optional<HostTarget> split_http_url(std::string_view url);
}
