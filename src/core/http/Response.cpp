#include "wxdown/core/http/Response.h"
#include <fmt/format.h>

namespace wxdown::core::http {
const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string serialize(const Response& resp, bool head_only) {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", resp.status, reason_phrase(resp.status));
    if (!resp.contentType.empty()) out += fmt::format("Content-Type: {}\r\n", resp.contentType);
    out += fmt::format("Content-Length: {}\r\n", resp.body.size());
    out += "Connection: close\r\n\r\n";
    if (!head_only) out += resp.body;
    return out;
}

Response html_error(int status, std::string_view title) {
    return Response{ status, "text/html", fmt::format("<h1>{} {}</h1>", status, title) };
}
}
