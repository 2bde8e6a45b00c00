#include "wxdown/core/server/FileServer.h"
#include "wxdown/core/server/FileSession.h"
#include "wxdown/core/lifecycle/LifecycleContext.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <chrono>

namespace wxdown::core::server {
namespace fs = std::filesystem;
using util::log_error;
using util::log_info;
using net::Socket;

std::shared_ptr<FileServer> FileServer::create(const fs::path& root, FileServerConfig cfg) {
    std::error_code ec;
    fs::path canonical = fs::canonical(root, ec);
    if (ec || !fs::is_directory(canonical, ec)) {
        log_error(fmt::format("file server root {} is not a directory", root.string()));
        return nullptr;
    }
    std::shared_ptr<FileServer> server(new FileServer(std::move(canonical), cfg));
    if (!server->start()) return nullptr;
    return server;
}

FileServer::FileServer(fs::path root, FileServerConfig cfg) : root_(std::move(root)), config(cfg) {}
FileServer::~FileServer() { close(); }

std::string FileServer::base_url() const { return fmt::format("http://127.0.0.1:{}/", port_); }

bool FileServer::start() {
    if (!listener.open(0, true)) {
        log_error(fmt::format("file server for {} could not bind", root_.string()));
        return false;
    }
    port_ = listener.local_port();
    active.store(true);
    io_thread = std::thread(&FileServer::run_loop, this);
    log_info(fmt::format("file server for {} listening on {}", root_.string(), base_url()));
    return true;
}

bool FileServer::close() {
    if (!active.exchange(false)) return true;
    auto dropped = io.stop();
    if (io_thread.joinable()) io_thread.join();
    listener.close();
    log_info(fmt::format("file server on port {} closed ({} pending request(s) dropped)", port_, dropped));
    return true;
}

void FileServer::run_loop() {
    while (active.load()) {
        io.poll();
        auto client = listener.accept();
        if (!client.valid()) { std::this_thread::sleep_for(std::chrono::milliseconds(4)); continue; }
        auto socket_ptr = std::make_shared<Socket>(std::move(client));
        auto session = std::make_shared<FileSession>(socket_ptr, root_, config);
        io.post([session]{ session->start(); });
    }
}

std::shared_ptr<FileServer> acquire(lifecycle::LifecycleContext& ctx, const fs::path& root) {
    std::error_code ec;
    fs::path key = fs::canonical(root, ec);
    if (ec) {
        log_error(fmt::format("cannot serve {}: {}", root.string(), ec.message()));
        return nullptr;
    }
    return ctx.obtain_file_server(key, [&]{ return FileServer::create(key); });
}
}
