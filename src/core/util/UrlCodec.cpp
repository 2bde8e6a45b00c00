#include "wxdown/core/util/UrlCodec.h"
#include <cctype>

namespace wxdown::core::util {
namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}
bool unreserved(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '!': case '~': case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}
}

std::optional<std::string> decode_component(std::string_view in) {
    std::string out; out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c != '%') { out.push_back(c); continue; }
        if (i + 2 >= in.size()) return std::nullopt;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::string decode_form_value(std::string_view in) {
    std::string out; out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') { out.push_back(' '); continue; }
        if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string encode_component(std::string_view in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(in.size() * 3);
    for (unsigned char c : in) {
        if (unreserved(c)) { out.push_back(static_cast<char>(c)); continue; }
        out.push_back('%');
        out.push_back(hex[c >> 4]);
        out.push_back(hex[c & 0xF]);
    }
    return out;
}

std::optional<std::vector<QueryParam>> parse_query(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;
    for (size_t i = 0; i < scheme_end; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::nullopt;
    }
    if (scheme_end + 3 >= url.size()) return std::nullopt;

    std::vector<QueryParam> params;
    auto hash = url.find('#');
    if (hash != std::string_view::npos) url = url.substr(0, hash);
    auto qmark = url.find('?');
    if (qmark == std::string_view::npos) return params;
    std::string_view query = url.substr(qmark + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string_view pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(decode_form_value(pair), std::string());
            } else {
                params.emplace_back(decode_form_value(pair.substr(0, eq)), decode_form_value(pair.substr(eq + 1)));
            }
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return params;
}

std::optional<std::string> find_param(const std::vector<QueryParam>& params, std::string_view name) {
    for (auto& p : params) {
        if (p.first == name) {
            if (p.second.empty()) return std::nullopt;
            return p.second;
        }
    }
    return std::nullopt;
}
}
