#pragma once
#include <string>
#include <optional>
#include "wxdown/core/net/Socket.h"

namespace wxdown::core::net {
class UpstreamConnector {
public:
    // Blocking-mode socket on success; tries every resolved address in turn.
    static std::optional<Socket> connect(const std::string& host, uint16_t port, int timeout_ms = 3000);
};
}
