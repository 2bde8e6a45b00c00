#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include "wxdown/core/credential/CredentialWatcher.h"
#include "wxdown/core/proxy/Config.h"
#include "wxdown/core/proxy/InterceptionEngine.h"
#include "wxdown/core/proxy/InterceptionProbe.h"
#include "wxdown/core/proxy/SystemProxy.h"

namespace wxdown::core::proxy {
// Keeps the interception engine and the OS proxy pointer in step, and feeds
// the capture log to a credential watcher while running.
class ProxySession {
public:
    ProxySession(std::shared_ptr<InterceptionEngine> engine, std::shared_ptr<SystemProxy> system_proxy,
                 ProxySessionConfig cfg, ProbeTransport transport = fetch_via_proxy);
    ~ProxySession();
    ProxySession(const ProxySession&) = delete;
    ProxySession& operator=(const ProxySession&) = delete;

    // Engine, then OS proxy, then watcher. On failure the steps already taken
    // are undone and nullopt is returned.
    std::optional<uint16_t> start();
    // Clears the OS proxy before stopping the engine it points to.
    bool stop();
    // Shutdown step: engine and watcher only, OS proxy left to the caller.
    bool halt_engine();
    // Heuristic: probes through the configured OS proxy and looks for the
    // "not intercepted" sentinel. No network I/O when no proxy is configured.
    bool verify_active();

    std::optional<uint16_t> port() const;
    credential::CredentialWatcher& watcher() { return watcher_; }
    SystemProxy& system_proxy() { return *system_proxy_; }
private:
    std::shared_ptr<InterceptionEngine> engine_;
    std::shared_ptr<SystemProxy> system_proxy_;
    ProxySessionConfig config;
    ProbeTransport transport_;
    credential::CredentialWatcher watcher_;
    mutable std::mutex mu;
    std::optional<uint16_t> port_;
};
}
