#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "wxdown/core/credential/CredentialWatcher.h"

namespace wxdown::core::proxy {
struct ProbeConfig {
    std::string url { "http://mitm.it/" };
    // Phrase the detection page shows when traffic bypasses the proxy.
    std::string sentinel { "If you can see this, traffic is not passing through mitmproxy" };
    int timeoutMs { 5000 };
    std::size_t maxResponseBytes { 1024 * 1024 };
};

struct MitmdumpConfig {
    std::string binary { "mitmdump" };
    std::filesystem::path addonScript;       // capture add-on writing the capture log (optional)
    std::filesystem::path confDir;           // mitmproxy --set confdir (empty = mitmproxy default)
    std::string listenHost { "127.0.0.1" };
    std::chrono::milliseconds readyTimeout { 15000 };
};

struct ProxySessionConfig {
    std::filesystem::path captureLog;
    credential::WatcherConfig watcher;
    ProbeConfig probe;
};
}
