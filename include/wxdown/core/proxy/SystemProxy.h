#pragma once
#include <optional>
#include "wxdown/core/http/HostUtil.h"

namespace wxdown::core::proxy {
// The operating system's HTTP(S) proxy pointer.
class SystemProxy {
public:
    virtual ~SystemProxy() = default;
    virtual bool set(const http::Endpoint& endpoint) = 0;
    virtual bool clear() = 0;
    // nullopt when no manual proxy is configured.
    virtual std::optional<http::Endpoint> current() = 0;
};
}
