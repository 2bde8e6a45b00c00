#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include "wxdown/core/net/IoContext.h"
#include "wxdown/core/net/Socket.h"

namespace wxdown::core::lifecycle { class LifecycleContext; }

namespace wxdown::core::server {
struct FileServerConfig {
    int requestTimeoutMs { 5000 };      // max wait for a complete request head
    int responseTimeoutMs { 10000 };    // max time to deliver one response
    std::size_t maxRequestHead { 16 * 1024 };
};

// Static file server bound to 127.0.0.1 on an ephemeral port, serving one
// canonical root. Connections are handled one at a time on the server thread.
class FileServer {
public:
    // Canonicalises root, binds and starts; nullptr when root is not an
    // existing directory or the bind fails.
    static std::shared_ptr<FileServer> create(const std::filesystem::path& root, FileServerConfig cfg = {});
    ~FileServer();
    FileServer(const FileServer&) = delete;
    FileServer& operator=(const FileServer&) = delete;

    uint16_t port() const { return port_; }
    const std::filesystem::path& root() const { return root_; }
    std::string base_url() const;
    bool running() const { return active.load(); }
    // Stops accepting, drains the accept thread and releases the port.
    bool close();
private:
    FileServer(std::filesystem::path root, FileServerConfig cfg);
    bool start();
    void run_loop();

    std::filesystem::path root_;
    FileServerConfig config;
    uint16_t port_{0};
    net::Listener listener;
    net::IoContext io;
    std::thread io_thread;
    std::atomic<bool> active{false};
};

// Returns the context's server for root (same instance, same port), creating
// and registering one on first use. nullptr when creation fails.
std::shared_ptr<FileServer> acquire(lifecycle::LifecycleContext& ctx, const std::filesystem::path& root);
}
