#pragma once
#include <filesystem>
#include "wxdown/core/credential/CredentialWatcher.h"
#include "wxdown/core/lifecycle/HeadlessChromeRenderer.h"
#include "wxdown/core/proxy/Config.h"
#include "wxdown/core/util/Logger.h"

namespace wxdown::core::lifecycle {
struct AppConfig {
    std::filesystem::path dataDir;
    std::filesystem::path captureLog;      // JSON array written by the capture add-on
    std::filesystem::path caCert;          // interception root certificate (PEM)
    util::Logger::Level logLevel { util::Logger::Level::info };
    std::filesystem::path logFile;         // optional copy of the log output
    proxy::MitmdumpConfig mitmdump;
    proxy::ProbeConfig probe;
    credential::WatcherConfig watcher;
    ChromeConfig chrome;
};

// $HOME/.wxdown based defaults; the data directory is created if missing.
AppConfig default_app_config();
// Repoints every path that derives from the data directory.
void set_data_dir(AppConfig& cfg, const std::filesystem::path& dir);
proxy::ProxySessionConfig session_config(const AppConfig& cfg);
}
