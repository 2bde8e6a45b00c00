#include "wxdown/core/credential/CredentialWatcher.h"
#include "wxdown/core/credential/CredentialParser.h"
#include "wxdown/core/util/FileIo.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>

namespace wxdown::core::credential {
using util::log_debug;
using util::log_info;

CredentialWatcher::CredentialWatcher(std::filesystem::path capture_log, WatcherConfig cfg)
    : path(std::move(capture_log)), config(cfg) {}

CredentialWatcher::~CredentialWatcher() { stop(); }

bool CredentialWatcher::start() {
    if (active.load()) return true;
    active.store(true);
    worker = std::thread(&CredentialWatcher::run_loop, this);
    log_info(fmt::format("watching {}", path.string()));
    return true;
}

void CredentialWatcher::stop() {
    {
        std::lock_guard lock(wake_mu);
        if (!active.load()) return;
        active.store(false);
    }
    wake.notify_all();
    if (worker.joinable()) worker.join();
    log_info("credential watcher stopped");
}

bool CredentialWatcher::poll_once() {
    std::lock_guard lock(poll_mu);
    std::error_code ec;
    Stamp stamp{};
    stamp.mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return false;
    stamp.size = std::filesystem::file_size(path, ec);
    if (ec) return false;
    if (last_seen && *last_seen == stamp) return false;

    std::string data;
    if (!util::read_file(path, data, ec)) {
        log_debug(fmt::format("capture log not readable yet: {}", ec.message()));
        return false;
    }
    last_seen = stamp;
    dispatcher_.publish(extract_credentials(data));
    return true;
}

void CredentialWatcher::run_loop() {
    while (active.load()) {
        poll_once();
        std::unique_lock lock(wake_mu);
        wake.wait_for(lock, config.pollInterval, [&]{ return !active.load(); });
    }
}
}
