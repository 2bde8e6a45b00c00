#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>
#include "wxdown/core/credential/CredentialDispatcher.h"

namespace wxdown::core::credential {
struct WatcherConfig {
    std::chrono::milliseconds pollInterval{1000};
};

// Polls the capture log and publishes a fresh credential list whenever the
// file's modification time or size changes.
class CredentialWatcher {
public:
    explicit CredentialWatcher(std::filesystem::path capture_log, WatcherConfig cfg = {});
    ~CredentialWatcher();
    CredentialWatcher(const CredentialWatcher&) = delete;
    CredentialWatcher& operator=(const CredentialWatcher&) = delete;

    bool start();
    void stop();
    bool running() const { return active.load(); }
    // Checks the file once on the calling thread; true when a list was published.
    bool poll_once();
    CredentialDispatcher& dispatcher() { return dispatcher_; }
private:
    struct Stamp {
        std::filesystem::file_time_type mtime;
        std::uintmax_t size{0};
        bool operator==(const Stamp& o) const { return mtime == o.mtime && size == o.size; }
    };
    std::filesystem::path path;
    WatcherConfig config;
    CredentialDispatcher dispatcher_;
    std::atomic<bool> active{false};
    std::thread worker;
    std::mutex wake_mu;
    std::condition_variable wake;
    std::mutex poll_mu;
    std::optional<Stamp> last_seen;
    void run_loop();
};
}
