#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace wxdown::core::http {
struct HttpHeader { std::string name; std::string value; };
struct HttpRequestLine { std::string method; std::string target; std::string version; };
struct HttpRequest { HttpRequestLine request_line; std::vector<HttpHeader> headers; };
struct HttpStatusLine { std::string version; int code{0}; std::string reason; };
struct HttpResponseHead { HttpStatusLine status_line; std::vector<HttpHeader> headers; };

class HttpParser {
public:
    std::optional<HttpRequestLine> parse_request_line(std::string_view line);
    std::optional<HttpRequest> parse_request(std::string_view data);
    std::optional<HttpStatusLine> parse_status_line(std::string_view line);
    // data must contain the full head (terminated by an empty line).
    std::optional<HttpResponseHead> parse_response_head(std::string_view data);
private:
    static void parse_header_lines(std::string_view block, std::vector<HttpHeader>& out);
};

// Case-insensitive lookup; nullptr when absent.
const HttpHeader* find_header(const std::vector<HttpHeader>& headers, std::string_view name);
}
