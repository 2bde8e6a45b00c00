#pragma once
#include <memory>
#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <string_view>
#include "wxdown/core/net/Socket.h"
#include "wxdown/core/http/HttpParser.h"
#include "wxdown/core/http/Response.h"
#include "wxdown/core/server/FileServer.h"

namespace wxdown::core::server {
// Produces the response for one request target below root.
http::Response respond_to(const std::filesystem::path& root, std::string_view target);

class FileSession : public std::enable_shared_from_this<FileSession> {
public:
    FileSession(std::shared_ptr<net::Socket> socket, const std::filesystem::path& root, const FileServerConfig& cfg);
    void start();
private:
    std::shared_ptr<net::Socket> sock;
    std::filesystem::path root;
    FileServerConfig config;
    http::HttpParser parser;
    std::vector<char> buffer;
    std::optional<http::HttpRequest> read_request();
};
}
