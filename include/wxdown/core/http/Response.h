#pragma once
#include <string>
#include <string_view>

namespace wxdown::core::http {
struct Response {
    int status{200};
    std::string contentType;
    std::string body;
};

const char* reason_phrase(int status);
// HTTP/1.1 wire form with Content-Length and Connection: close. head_only
// keeps the headers of a GET but omits the body.
std::string serialize(const Response& resp, bool head_only = false);
Response html_error(int status, std::string_view title);
}
