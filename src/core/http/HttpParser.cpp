#include "wxdown/core/http/HttpParser.h"
#include <cctype>
#include <cstdlib>

namespace wxdown::core::http {
namespace {
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}
}

std::optional<HttpRequestLine> HttpParser::parse_request_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) return std::nullopt;
    HttpRequestLine rl;
    rl.method = std::string(line.substr(0, first_space));
    rl.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    rl.version = std::string(line.substr(second_space + 1));
    if (rl.method.empty() || rl.target.empty()) return std::nullopt;
    return rl;
}

std::optional<HttpStatusLine> HttpParser::parse_status_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    HttpStatusLine sl;
    sl.version = std::string(line.substr(0, first_space));
    if (sl.version.rfind("HTTP/", 0) != 0) return std::nullopt;
    auto rest = line.substr(first_space + 1);
    auto second_space = rest.find(' ');
    std::string code(rest.substr(0, second_space));
    if (code.size() != 3) return std::nullopt;
    for (char c : code) if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    sl.code = std::atoi(code.c_str());
    if (second_space != std::string_view::npos) sl.reason = std::string(rest.substr(second_space + 1));
    return sl;
}

void HttpParser::parse_header_lines(std::string_view block, std::vector<HttpHeader>& out) {
    size_t pos = 0;
    while (pos < block.size()) {
        auto next = block.find("\r\n", pos);
        auto line = block.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            std::string name(line.substr(0, colon));
            size_t value_start = colon + 1;
            while (value_start < line.size() && (line[value_start] == ' ' || line[value_start] == '\t')) value_start++;
            std::string value(line.substr(value_start));
            out.push_back(HttpHeader{ std::move(name), std::move(value) });
        }
        if (next == std::string_view::npos) break;
        pos = next + 2;
    }
}

std::optional<HttpRequest> HttpParser::parse_request(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto rl_opt = parse_request_line(head.substr(0, first_eol));
    if (!rl_opt) return std::nullopt;
    HttpRequest req; req.request_line = std::move(*rl_opt);
    if (first_eol != std::string_view::npos) parse_header_lines(head.substr(first_eol + 2), req.headers);
    return req;
}

std::optional<HttpResponseHead> HttpParser::parse_response_head(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto sl = parse_status_line(head.substr(0, first_eol));
    if (!sl) return std::nullopt;
    HttpResponseHead resp; resp.status_line = std::move(*sl);
    if (first_eol != std::string_view::npos) parse_header_lines(head.substr(first_eol + 2), resp.headers);
    return resp;
}

const HttpHeader* find_header(const std::vector<HttpHeader>& headers, std::string_view name) {
    for (auto& h : headers) {
        if (iequals(h.name, name)) return &h;
    }
    return nullptr;
}
}
