#include "wxdown/core/server/FileSession.h"
#include "wxdown/core/server/PathSandbox.h"
#include "wxdown/core/http/MimeTypes.h"
#include "wxdown/core/util/FileIo.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <cerrno>
#include <chrono>

namespace wxdown::core::server {
namespace fs = std::filesystem;
using util::log_debug;
using util::log_warn;

namespace {
std::string errno_name(int code) {
    switch (code) {
        case EACCES: return "EACCES";
        case EPERM: return "EPERM";
        case EISDIR: return "EISDIR";
        case ENOTDIR: return "ENOTDIR";
        case ELOOP: return "ELOOP";
        case EMFILE: return "EMFILE";
        case ENFILE: return "ENFILE";
        case ENAMETOOLONG: return "ENAMETOOLONG";
        case EIO: return "EIO";
        case ENOMEM: return "ENOMEM";
        default: return fmt::format("E{}", code);
    }
}
}

http::Response respond_to(const fs::path& root, std::string_view target) {
    auto lexical = resolve_in_root(root, target);
    if (!lexical) return http::html_error(403, "Forbidden");

    auto resolved = confine_resolved(root, *lexical);
    if (!resolved) return http::html_error(403, "Forbidden");

    std::error_code ec;
    if (fs::is_directory(*resolved, ec)) {
        resolved = confine_resolved(root, *resolved / "index.html");
        if (!resolved) return http::html_error(403, "Forbidden");
    }

    http::Response resp;
    resp.contentType = std::string(http::mime_type_for(*resolved));
    if (!util::read_file(*resolved, resp.body, ec)) {
        if (ec.value() == ENOENT) return http::html_error(404, "Not Found");
        log_warn(fmt::format("serving {} failed: {}", resolved->string(), ec.message()));
        return http::Response{ 500, "text/plain", fmt::format("Sorry, there was an error: {} ..\n", errno_name(ec.value())) };
    }
    resp.status = 200;
    return resp;
}

FileSession::FileSession(std::shared_ptr<net::Socket> socket, const fs::path& root_dir, const FileServerConfig& cfg)
    : sock(std::move(socket)), root(root_dir), config(cfg) {
    buffer.resize(8192);
}

std::optional<http::HttpRequest> FileSession::read_request() {
    std::string accumulated;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.requestTimeoutMs);
    while (accumulated.find("\r\n\r\n") == std::string::npos) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0 || !sock->wait_readable(static_cast<int>(left))) return std::nullopt;
        auto r = sock->recv_some(buffer);
        if (!r) return std::nullopt;
        accumulated.append(buffer.data(), static_cast<size_t>(*r));
        if (accumulated.size() > config.maxRequestHead) return std::nullopt;
    }
    return parser.parse_request(accumulated);
}

void FileSession::start() {
    auto req = read_request();
    if (!req) {
        if (!sock->send_all(http::serialize(http::html_error(400, "Bad Request")), config.responseTimeoutMs))
            log_debug("client left before the 400 response was sent");
        sock->close();
        return;
    }
    const auto& method = req->request_line.method;
    const auto& target = req->request_line.target;
    http::Response resp;
    if (method != "GET" && method != "HEAD") {
        resp = http::html_error(405, "Method Not Allowed");
    } else {
        resp = respond_to(root, target);
    }
    log_debug(fmt::format("{} {} -> {}", method, target, resp.status));
    if (!sock->send_all(http::serialize(resp, method == "HEAD"), config.responseTimeoutMs))
        log_warn(fmt::format("response to {} {} abandoned after {} ms", method, target, config.responseTimeoutMs));
    sock->close();
}
}
