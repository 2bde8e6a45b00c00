#include "wxdown/core/http/HostUtil.h"
#include <algorithm>
#include <cctype>

namespace wxdown::core::http {
namespace {
std::string to_lower(std::string v) { std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); }); return v; }

std::optional<uint16_t> parse_port(std::string_view s) {
    if (s.empty() || s.size() > 5) return std::nullopt;
    unsigned v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + unsigned(c - '0');
    }
    if (v == 0 || v > 65535) return std::nullopt;
    return static_cast<uint16_t>(v);
}
}

std::string Endpoint::to_string() const {
    if (host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

bool operator==(const Endpoint& a, const Endpoint& b) { return a.host == b.host && a.port == b.port; }

std::optional<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    auto scheme_end = text.find("://");
    if (scheme_end != std::string_view::npos) {
        auto scheme = to_lower(std::string(text.substr(0, scheme_end)));
        if (scheme == "https") default_port = 443;
        text.remove_prefix(scheme_end + 3);
    }
    auto slash = text.find('/');
    if (slash != std::string_view::npos) text = text.substr(0, slash);
    auto at = text.rfind('@');
    if (at != std::string_view::npos) text.remove_prefix(at + 1);
    if (text.empty()) return std::nullopt;

    Endpoint ep; ep.port = default_port;
    if (text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos || close == 1) return std::nullopt;
        ep.host = std::string(text.substr(1, close - 1));
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            auto p = parse_port(rest.substr(1));
            if (!p) return std::nullopt;
            ep.port = *p;
        }
        return ep;
    }
    auto colon = text.rfind(':');
    if (colon != std::string_view::npos) {
        auto p = parse_port(text.substr(colon + 1));
        if (!p) return std::nullopt;
        ep.port = *p;
        text = text.substr(0, colon);
    }
    if (text.empty()) return std::nullopt;
    ep.host = to_lower(std::string(text));
    return ep;
}

std::optional<HostTarget> split_http_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;
    auto after = scheme_end + 3;
    auto slash = url.find('/', after);
    auto ep = parse_endpoint(url.substr(0, slash));
    if (!ep) return std::nullopt;
    HostTarget t{ *ep, slash == std::string_view::npos ? std::string("/") : std::string(url.substr(slash)) };
    return t;
}
}
