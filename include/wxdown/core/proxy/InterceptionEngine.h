#pragma once
#include <cstdint>
#include <optional>

namespace wxdown::core::proxy {
// Local MITM proxy service. start() reports the port it listens on.
class InterceptionEngine {
public:
    virtual ~InterceptionEngine() = default;
    virtual std::optional<uint16_t> start() = 0;
    // True when the engine is no longer running afterwards.
    virtual bool stop() = 0;
    virtual bool running() = 0;
};
}
