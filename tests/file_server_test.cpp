#include "wxdown/core/server/FileServer.h"
#include "wxdown/core/lifecycle/LifecycleContext.h"
#include "wxdown/core/net/UpstreamConnector.h"
#include "TestSupport.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cassert>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace wxdown::core;
using namespace wxdown_test;

int main() {
    TempDir dir("fileserver");
    fs::path site = dir.path / "site";
    fs::create_directories(site / "img");
    fs::create_directories(dir.path / "private");
    write_text(site / "index.html", "<h1>article</h1>");
    write_text(site / "img" / "a.png", std::string("\x89PNG\r\n", 6));
    write_text(dir.path / "private" / "key.txt", "do not serve");
    fs::create_directory_symlink(dir.path / "private", site / "link");

    lifecycle::LifecycleContext ctx;
    auto server = server::acquire(ctx, site);
    assert(server);
    assert(server->port() != 0);
    assert(server->root() == fs::canonical(site));
    assert(server->base_url() == "http://127.0.0.1:" + std::to_string(server->port()) + "/");
    uint16_t port = server->port();

    // Same root, same instance; a differently spelled root maps to it too
    {
        auto again = server::acquire(ctx, site);
        assert(again == server);
        auto spelled = server::acquire(ctx, site / "img" / "..");
        assert(spelled == server);
        assert(ctx.file_server_count() == 1);
    }

    // Missing roots fail fast
    {
        assert(!server::acquire(ctx, dir.path / "nope"));
        assert(ctx.file_server_count() == 1);
    }

    // Static content
    {
        auto r = http_get(port, "/");
        assert(status_of(r) == 200);
        assert(r.find("Content-Type: text/html\r\n") != std::string::npos);
        assert(body_of(r) == "<h1>article</h1>");

        auto png = http_get(port, "/img/a.png");
        assert(status_of(png) == 200);
        assert(png.find("Content-Type: image/png\r\n") != std::string::npos);
        assert(body_of(png) == std::string("\x89PNG\r\n", 6));

        assert(status_of(http_get(port, "/img/missing.png")) == 404);

        auto broken = http_get(port, "/index.html/more");
        assert(status_of(broken) == 500);
        assert(body_of(broken).find("ENOTDIR") != std::string::npos);
    }

    // Traversal and symlink escapes are refused
    {
        auto r = http_get(port, "/../private/key.txt");
        assert(status_of(r) == 403);
        assert(body_of(r).find("do not serve") == std::string::npos);
        assert(status_of(http_get(port, "/%2e%2e/private/key.txt")) == 403);
        assert(status_of(http_get(port, "/img/..%2F..%2Fprivate%2Fkey.txt")) == 403);
        assert(status_of(http_get(port, "/link/key.txt")) == 403);
    }

    // Methods and malformed requests
    {
        auto head = http_exchange(port, "HEAD / HTTP/1.1\r\nHost: x\r\n\r\n");
        assert(status_of(head) == 200);
        assert(head.find("Content-Length: 16\r\n") != std::string::npos);
        assert(body_of(head).empty());

        auto post = http_exchange(port, "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");
        assert(status_of(post) == 405);

        auto bad = http_exchange(port, "garbage\r\n\r\n");
        assert(status_of(bad) == 400);
    }

    // A second root gets its own server
    {
        fs::path other = dir.path / "other";
        fs::create_directories(other);
        write_text(other / "index.html", "other");
        auto second = server::acquire(ctx, other);
        assert(second && second != server);
        assert(second->port() != port);
        assert(body_of(http_get(second->port(), "/")) == "other");
        assert(ctx.file_server_count() == 2);
    }

    // Shutdown closes every server and releases the ports
    {
        auto report = ctx.shutdown();
        assert(report.ok());
        assert(report.completed.size() == 2);
        assert(ctx.file_server_count() == 0);
        assert(!server->running());
        assert(!net::UpstreamConnector::connect("127.0.0.1", port, 500));
    }

    // The emptied context hands out fresh servers
    {
        auto fresh = server::acquire(ctx, site);
        assert(fresh && fresh != server);
        assert(status_of(http_get(fresh->port(), "/")) == 200);
    }

    // A client that never reads its response cannot hold up shutdown
    {
        fs::path bulk = dir.path / "bulk";
        fs::create_directories(bulk);
        write_text(bulk / "big.bin", std::string(32 * 1024 * 1024, 'x'));

        server::FileServerConfig cfg;
        cfg.responseTimeoutMs = 300;
        auto slow = server::FileServer::create(bulk, cfg);
        assert(slow);
        lifecycle::LifecycleContext slow_ctx;
        assert(slow_ctx.register_file_server(slow->root(), slow));

        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(fd >= 0);
        int rcvbuf = 4096;
        ::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(slow->port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        std::string req = "GET /big.bin HTTP/1.1\r\nHost: x\r\n\r\n";
        assert(::send(fd, req.data(), req.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(req.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto done = std::async(std::launch::async, [&]{ return slow_ctx.shutdown(); });
        assert(done.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        assert(done.get().ok());
        assert(!slow->running());
        ::close(fd);
    }
    return 0;
}
