#include "wxdown/core/proxy/ProxySession.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>

namespace wxdown::core::proxy {
using util::log_error;
using util::log_info;
using util::log_warn;

ProxySession::ProxySession(std::shared_ptr<InterceptionEngine> engine, std::shared_ptr<SystemProxy> system_proxy,
                           ProxySessionConfig cfg, ProbeTransport transport)
    : engine_(std::move(engine)), system_proxy_(std::move(system_proxy)), config(std::move(cfg)),
      transport_(std::move(transport)), watcher_(config.captureLog, config.watcher) {}

ProxySession::~ProxySession() { watcher_.stop(); }

std::optional<uint16_t> ProxySession::start() {
    std::lock_guard lock(mu);
    if (port_) return port_;
    auto port = engine_->start();
    if (!port) {
        log_error("interception proxy failed to start");
        return std::nullopt;
    }
    if (!system_proxy_->set(http::Endpoint{ "127.0.0.1", *port })) {
        log_error("could not point the system proxy at the interception proxy");
        engine_->stop();
        return std::nullopt;
    }
    if (!watcher_.start()) {
        log_error("credential watcher failed to start");
        system_proxy_->clear();
        engine_->stop();
        return std::nullopt;
    }
    port_ = port;
    log_info(fmt::format("proxy session active on 127.0.0.1:{}", *port));
    return port;
}

bool ProxySession::stop() {
    std::lock_guard lock(mu);
    bool cleared = system_proxy_->clear();
    if (!cleared) log_warn("clearing the system proxy failed");
    bool stopped = engine_->stop();
    if (!stopped) log_warn("stopping the interception proxy failed");
    watcher_.stop();
    port_.reset();
    return cleared && stopped;
}

bool ProxySession::halt_engine() {
    std::lock_guard lock(mu);
    bool stopped = engine_->stop();
    watcher_.stop();
    port_.reset();
    return stopped;
}

bool ProxySession::verify_active() {
    auto proxy = system_proxy_->current();
    if (!proxy) return false;
    auto body = transport_(*proxy, config.probe);
    if (!body) {
        log_warn(fmt::format("interception probe via {} failed", proxy->to_string()));
        return false;
    }
    return body_shows_interception(*body, config.probe);
}

std::optional<uint16_t> ProxySession::port() const {
    std::lock_guard lock(mu);
    return port_;
}
}
