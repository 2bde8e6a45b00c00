#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "wxdown/core/lifecycle/BrowserRenderer.h"

namespace wxdown::core::server { class FileServer; }
namespace wxdown::core::proxy { class ProxySession; class SystemProxy; }

namespace wxdown::core::lifecycle {
using BrowserFactory = std::function<std::unique_ptr<BrowserRenderer>()>;

struct LifecycleOptions {
    std::shared_ptr<proxy::SystemProxy> systemProxy; // cleared on shutdown; else the proxy session's own
    BrowserFactory browserFactory;                   // used by ensure_browser()
};

struct ShutdownReport {
    std::vector<std::string> completed;
    std::vector<std::string> failures;
    bool ok() const { return failures.empty(); }
};

// Owns every long-lived resource of the application and releases them in a
// fixed order: interception proxy, OS proxy pointer, browser, file servers.
// Destruction performs shutdown(). After shutdown the context is empty and
// can be populated again; a repeated shutdown with nothing new registered
// is a no-op.
class LifecycleContext {
public:
    explicit LifecycleContext(LifecycleOptions opts = {});
    ~LifecycleContext();
    LifecycleContext(const LifecycleContext&) = delete;
    LifecycleContext& operator=(const LifecycleContext&) = delete;

    // False if root already has a server; the existing one is kept.
    bool register_file_server(const std::filesystem::path& root, std::shared_ptr<server::FileServer> instance);
    std::shared_ptr<server::FileServer> file_server(const std::filesystem::path& root) const;
    // Existing instance for root or the result of make(), registered atomically.
    std::shared_ptr<server::FileServer> obtain_file_server(const std::filesystem::path& root,
                                                           const std::function<std::shared_ptr<server::FileServer>()>& make);
    std::size_t file_server_count() const;

    // Replaces (and closes) any previous browser.
    void register_browser(std::unique_ptr<BrowserRenderer> handle);
    // Launches through the factory on first use; nullptr without a factory.
    BrowserRenderer* ensure_browser();
    bool has_browser() const;

    void register_proxy_session(std::shared_ptr<proxy::ProxySession> session);
    std::shared_ptr<proxy::ProxySession> proxy_session() const;

    // Every step is attempted even when an earlier one fails.
    ShutdownReport shutdown();
private:
    LifecycleOptions options;
    mutable std::mutex mu;
    std::shared_ptr<proxy::ProxySession> proxy_;
    std::unique_ptr<BrowserRenderer> browser_;
    std::map<std::filesystem::path, std::shared_ptr<server::FileServer>> file_servers_;
    // The OS proxy may be left over from an earlier run, so the first
    // shutdown always runs.
    bool pending_release{true};
};
}
