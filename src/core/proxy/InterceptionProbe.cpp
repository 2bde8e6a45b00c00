#include "wxdown/core/proxy/InterceptionProbe.h"
#include "wxdown/core/http/ChunkedDecoder.h"
#include "wxdown/core/http/HttpParser.h"
#include "wxdown/core/net/UpstreamConnector.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <chrono>
#include <vector>

namespace wxdown::core::proxy {
using util::log_debug;

std::optional<std::string> fetch_via_proxy(const http::Endpoint& proxy, const ProbeConfig& cfg) {
    auto target = http::split_http_url(cfg.url);
    if (!target) return std::nullopt;
    auto sock = net::UpstreamConnector::connect(proxy.host, proxy.port, cfg.timeoutMs);
    if (!sock) {
        log_debug(fmt::format("probe: proxy {} unreachable", proxy.to_string()));
        return std::nullopt;
    }
    // Absolute-form target, as a client talking to a forward proxy sends it.
    std::string request = fmt::format("GET {} HTTP/1.1\r\nHost: {}\r\nUser-Agent: wxdown-probe\r\nAccept: text/plain, */*\r\nConnection: close\r\n\r\n",
                                      cfg.url, target->endpoint.port == 80 ? target->endpoint.host : target->endpoint.to_string());
    if (!sock->send_all(request)) return std::nullopt;

    std::string raw;
    std::vector<char> buffer(8192);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.timeoutMs);
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0 || !sock->wait_readable(static_cast<int>(left))) break;
        auto r = sock->recv_some(buffer);
        if (!r) break;
        raw.append(buffer.data(), static_cast<size_t>(*r));
        if (raw.size() > cfg.maxResponseBytes) break;
    }

    http::HttpParser parser;
    auto head = parser.parse_response_head(raw);
    if (!head) {
        log_debug("probe: no valid HTTP response");
        return std::nullopt;
    }
    std::string body = raw.substr(raw.find("\r\n\r\n") + 4);
    auto te = http::find_header(head->headers, "Transfer-Encoding");
    if (te && te->value.find("chunked") != std::string::npos) {
        http::ChunkedDecoder dec;
        dec.feed(body);
        body = dec.take_decoded();
    }
    return body;
}

bool body_shows_interception(const std::string& body, const ProbeConfig& cfg) {
    return body.find(cfg.sentinel) == std::string::npos;
}
}
