#include "wxdown/core/lifecycle/LifecycleContext.h"
#include "wxdown/core/proxy/ProxySession.h"
#include "wxdown/core/proxy/SystemProxy.h"
#include "wxdown/core/server/FileServer.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <exception>

namespace wxdown::core::lifecycle {
using util::log_error;
using util::log_info;

namespace {
// Runs one teardown step, recording the outcome instead of propagating it.
template <typename Step>
void run_step(ShutdownReport& report, const std::string& name, Step&& step) {
    bool ok = false;
    try {
        ok = step();
    } catch (const std::exception& e) {
        log_error(fmt::format("{} threw: {}", name, e.what()));
    }
    if (ok) {
        report.completed.push_back(name);
    } else {
        log_error(fmt::format("{} failed", name));
        report.failures.push_back(name);
    }
}
}

LifecycleContext::LifecycleContext(LifecycleOptions opts) : options(std::move(opts)) {}

LifecycleContext::~LifecycleContext() { shutdown(); }

bool LifecycleContext::register_file_server(const std::filesystem::path& root, std::shared_ptr<server::FileServer> instance) {
    if (!instance) return false;
    std::lock_guard lock(mu);
    bool added = file_servers_.emplace(root, std::move(instance)).second;
    if (added) pending_release = true;
    return added;
}

std::shared_ptr<server::FileServer> LifecycleContext::file_server(const std::filesystem::path& root) const {
    std::lock_guard lock(mu);
    auto it = file_servers_.find(root);
    return it == file_servers_.end() ? nullptr : it->second;
}

std::shared_ptr<server::FileServer> LifecycleContext::obtain_file_server(const std::filesystem::path& root,
                                                                          const std::function<std::shared_ptr<server::FileServer>()>& make) {
    std::lock_guard lock(mu);
    auto it = file_servers_.find(root);
    if (it != file_servers_.end()) return it->second;
    auto created = make();
    if (created) { file_servers_.emplace(root, created); pending_release = true; }
    return created;
}

std::size_t LifecycleContext::file_server_count() const {
    std::lock_guard lock(mu);
    return file_servers_.size();
}

void LifecycleContext::register_browser(std::unique_ptr<BrowserRenderer> handle) {
    std::unique_ptr<BrowserRenderer> previous;
    {
        std::lock_guard lock(mu);
        previous = std::move(browser_);
        browser_ = std::move(handle);
        pending_release = true;
    }
    if (previous) previous->close();
}

BrowserRenderer* LifecycleContext::ensure_browser() {
    std::lock_guard lock(mu);
    if (!browser_ && options.browserFactory) {
        browser_ = options.browserFactory();
        if (browser_) { log_info("browser launched"); pending_release = true; }
    }
    return browser_.get();
}

bool LifecycleContext::has_browser() const {
    std::lock_guard lock(mu);
    return browser_ != nullptr;
}

void LifecycleContext::register_proxy_session(std::shared_ptr<proxy::ProxySession> session) {
    std::lock_guard lock(mu);
    proxy_ = std::move(session);
    pending_release = true;
}

std::shared_ptr<proxy::ProxySession> LifecycleContext::proxy_session() const {
    std::lock_guard lock(mu);
    return proxy_;
}

ShutdownReport LifecycleContext::shutdown() {
    std::shared_ptr<proxy::ProxySession> proxy;
    std::unique_ptr<BrowserRenderer> browser;
    std::map<std::filesystem::path, std::shared_ptr<server::FileServer>> servers;
    {
        std::lock_guard lock(mu);
        if (!pending_release) return {};
        pending_release = false;
        proxy = std::move(proxy_);
        browser = std::move(browser_);
        servers.swap(file_servers_);
    }
    ShutdownReport report;
    log_info("releasing resources...");

    if (proxy) run_step(report, "stop interception proxy", [&]{ return proxy->halt_engine(); });
    if (options.systemProxy) run_step(report, "clear system proxy", [&]{ return options.systemProxy->clear(); });
    else if (proxy) run_step(report, "clear system proxy", [&]{ return proxy->system_proxy().clear(); });
    if (browser) {
        log_info("closing browser");
        run_step(report, "close browser", [&]{ return browser->close(); });
    }
    for (auto& [root, server] : servers) {
        log_info(fmt::format("closing file server for {}", root.string()));
        run_step(report, fmt::format("close file server {}", root.string()), [&]{ return server->close(); });
    }
    log_info(fmt::format("resources released, {} step(s) failed", report.failures.size()));
    return report;
}
}
