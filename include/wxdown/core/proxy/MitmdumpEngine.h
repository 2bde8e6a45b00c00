#pragma once
#include <mutex>
#include "wxdown/core/proxy/Config.h"
#include "wxdown/core/proxy/InterceptionEngine.h"
#include "wxdown/core/util/Process.h"

namespace wxdown::core::proxy {
// Runs mitmproxy's mitmdump as a child process on a free loopback port.
class MitmdumpEngine : public InterceptionEngine {
public:
    explicit MitmdumpEngine(MitmdumpConfig cfg = {}) : config(std::move(cfg)) {}
    ~MitmdumpEngine() override;
    std::optional<uint16_t> start() override;
    bool stop() override;
    bool running() override;
    uint16_t port() const { return port_; }
private:
    MitmdumpConfig config;
    std::mutex mu;
    util::ChildProcess child;
    uint16_t port_{0};
    std::vector<std::string> command_line(uint16_t port) const;
};

// Port the OS hands out for a throwaway loopback bind; 0 on failure.
uint16_t pick_free_port();
}
