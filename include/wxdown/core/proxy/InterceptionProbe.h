#pragma once
#include <functional>
#include <optional>
#include <string>
#include "wxdown/core/http/HostUtil.h"
#include "wxdown/core/proxy/Config.h"

namespace wxdown::core::proxy {
// Fetches url through proxy and returns the (de-chunked) body, nullopt on any
// transport failure.
using ProbeTransport = std::function<std::optional<std::string>(const http::Endpoint& proxy, const ProbeConfig& cfg)>;

std::optional<std::string> fetch_via_proxy(const http::Endpoint& proxy, const ProbeConfig& cfg);

// True when body does not carry the "not intercepted" sentinel.
bool body_shows_interception(const std::string& body, const ProbeConfig& cfg);
}
