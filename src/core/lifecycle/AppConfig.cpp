#include "wxdown/core/lifecycle/AppConfig.h"
#include "wxdown/core/tls/CaTrust.h"
#include <cstdlib>

namespace wxdown::core::lifecycle {
namespace fs = std::filesystem;

void set_data_dir(AppConfig& cfg, const fs::path& dir) {
    cfg.dataDir = dir;
    cfg.captureLog = dir / "credentials.json";
    std::error_code ec;
    fs::create_directories(dir, ec);
    auto addon = dir / "capture_addon.py";
    cfg.mitmdump.addonScript = fs::exists(addon, ec) ? addon : fs::path();
}

AppConfig default_app_config() {
    AppConfig cfg;
    const char* home = std::getenv("HOME");
    fs::path base = home ? fs::path(home) : fs::path(".");
    set_data_dir(cfg, base / ".wxdown");
    cfg.caCert = tls::default_ca_cert_path();
    return cfg;
}

proxy::ProxySessionConfig session_config(const AppConfig& cfg) {
    proxy::ProxySessionConfig sc;
    sc.captureLog = cfg.captureLog;
    sc.watcher = cfg.watcher;
    sc.probe = cfg.probe;
    return sc;
}
}
