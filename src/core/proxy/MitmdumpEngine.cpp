#include "wxdown/core/proxy/MitmdumpEngine.h"
#include "wxdown/core/net/Socket.h"
#include "wxdown/core/net/UpstreamConnector.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <thread>

namespace wxdown::core::proxy {
using util::log_error;
using util::log_info;

uint16_t pick_free_port() {
    net::Listener probe;
    if (!probe.open(0, true)) return 0;
    return probe.local_port();
}

MitmdumpEngine::~MitmdumpEngine() { stop(); }

std::vector<std::string> MitmdumpEngine::command_line(uint16_t port) const {
    std::vector<std::string> argv{ config.binary, "--listen-host", config.listenHost, "--listen-port", std::to_string(port) };
    if (!config.addonScript.empty()) { argv.push_back("-s"); argv.push_back(config.addonScript.string()); }
    if (!config.confDir.empty()) { argv.push_back("--set"); argv.push_back("confdir=" + config.confDir.string()); }
    return argv;
}

std::optional<uint16_t> MitmdumpEngine::start() {
    std::lock_guard lock(mu);
    if (child.running()) return port_;
    uint16_t port = pick_free_port();
    if (port == 0) {
        log_error("no free port for the interception proxy");
        return std::nullopt;
    }
    if (!child.spawn(command_line(port))) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + config.readyTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.running()) {
            log_error(fmt::format("{} exited during startup", config.binary));
            return std::nullopt;
        }
        if (net::UpstreamConnector::connect(config.listenHost, port, 200)) {
            port_ = port;
            log_info(fmt::format("interception proxy pid {} listening on {}:{}", child.pid(), config.listenHost, port));
            return port;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    log_error(fmt::format("{} did not open port {} in time", config.binary, port));
    child.terminate();
    return std::nullopt;
}

bool MitmdumpEngine::stop() {
    std::lock_guard lock(mu);
    if (!child.running()) return true;
    bool ok = child.terminate();
    if (ok) log_info("interception proxy stopped");
    else log_error("interception proxy did not stop");
    port_ = 0;
    return ok;
}

bool MitmdumpEngine::running() {
    std::lock_guard lock(mu);
    return child.running();
}
}
