#include "wxdown/core/util/Json.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace wxdown::core::util {
namespace {
void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) { out.push_back(char(cp)); }
    else if (cp < 0x800) { out.push_back(char(0xC0 | (cp >> 6))); out.push_back(char(0x80 | (cp & 0x3F))); }
    else if (cp < 0x10000) { out.push_back(char(0xE0 | (cp >> 12))); out.push_back(char(0x80 | ((cp >> 6) & 0x3F))); out.push_back(char(0x80 | (cp & 0x3F))); }
    else { out.push_back(char(0xF0 | (cp >> 18))); out.push_back(char(0x80 | ((cp >> 12) & 0x3F))); out.push_back(char(0x80 | ((cp >> 6) & 0x3F))); out.push_back(char(0x80 | (cp & 0x3F))); }
}
}

void JsonCursor::skip_ws() {
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') ++pos_; else break;
    }
}

bool JsonCursor::consume(char c) {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == c) { ++pos_; return true; }
    return false;
}

bool JsonCursor::read_hex4(unsigned& out) {
    if (pos_ + 4 > text_.size()) return false;
    out = 0;
    for (int i = 0; i < 4; ++i) {
        char c = text_[pos_++];
        unsigned d;
        if (c >= '0' && c <= '9') d = unsigned(c - '0');
        else if (c >= 'a' && c <= 'f') d = 10u + unsigned(c - 'a');
        else if (c >= 'A' && c <= 'F') d = 10u + unsigned(c - 'A');
        else return false;
        out = (out << 4) | d;
    }
    return true;
}

std::optional<std::string> JsonCursor::read_string() {
    if (!consume('"')) return std::nullopt;
    std::string out;
    while (pos_ < text_.size()) {
        char c = text_[pos_++];
        if (c == '"') return out;
        if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
        if (c != '\\') { out.push_back(c); continue; }
        if (pos_ >= text_.size()) return std::nullopt;
        char e = text_[pos_++];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                unsigned cp;
                if (!read_hex4(cp)) return std::nullopt;
                if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 6 <= text_.size() && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
                    size_t save = pos_;
                    pos_ += 2;
                    unsigned lo;
                    if (read_hex4(lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else {
                        pos_ = save;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> JsonCursor::read_number() {
    skip_ws();
    size_t start = pos_;
    auto digits = [&]{ size_t s = pos_; while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_; return pos_ > s; };
    if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
    if (pos_ < text_.size() && text_[pos_] == '0') { ++pos_; }
    else if (!digits()) { pos_ = start; return std::nullopt; }
    if (pos_ < text_.size() && text_[pos_] == '.') { ++pos_; if (!digits()) { pos_ = start; return std::nullopt; } }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
        ++pos_;
        if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
        if (!digits()) { pos_ = start; return std::nullopt; }
    }
    std::string num(text_.substr(start, pos_ - start));
    return std::strtod(num.c_str(), nullptr);
}

bool JsonCursor::read_literal(std::string_view literal) {
    skip_ws();
    if (text_.substr(pos_, literal.size()) != literal) return false;
    pos_ += literal.size();
    return true;
}

std::optional<std::string_view> JsonCursor::skip_value() {
    skip_ws();
    size_t start = pos_;
    if (pos_ >= text_.size()) return std::nullopt;
    char c = text_[pos_];
    bool ok = false;
    if (c == '"') {
        ok = read_string().has_value();
    } else if (c == '{' || c == '[') {
        if (++depth_ > kMaxDepth) return std::nullopt;
        char close = c == '{' ? '}' : ']';
        ++pos_;
        if (consume(close)) {
            ok = true;
        } else {
            for (;;) {
                if (c == '{') {
                    if (!read_string() || !consume(':')) return std::nullopt;
                }
                if (!skip_value()) return std::nullopt;
                if (consume(',')) continue;
                if (consume(close)) { ok = true; break; }
                return std::nullopt;
            }
        }
        --depth_;
    } else if (c == 't') {
        ok = read_literal("true");
    } else if (c == 'f') {
        ok = read_literal("false");
    } else if (c == 'n') {
        ok = read_literal("null");
    } else {
        ok = read_number().has_value();
    }
    if (!ok) return std::nullopt;
    return text_.substr(start, pos_ - start);
}

std::string json_escape(std::string_view in) {
    std::string o; o.reserve(in.size() + 8);
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        switch (c) {
            case '"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            case '\b': o += "\\b"; break;
            case '\f': o += "\\f"; break;
            default: {
                auto b = static_cast<unsigned char>(c);
                char buf[7];
                if (b < 0x20) {
                    std::snprintf(buf, sizeof(buf), "\\u%04x", b);
                    o += buf;
                } else if (b == 0xED && i + 2 < in.size() && (static_cast<unsigned char>(in[i + 1]) & 0xE0) == 0xA0
                           && (static_cast<unsigned char>(in[i + 2]) & 0xC0) == 0x80) {
                    // Lone surrogate code point (ED A0..BF xx) is not valid UTF-8.
                    unsigned cp = 0xD000u | ((static_cast<unsigned char>(in[i + 1]) & 0x3Fu) << 6) | (static_cast<unsigned char>(in[i + 2]) & 0x3Fu);
                    std::snprintf(buf, sizeof(buf), "\\u%04x", cp);
                    o += buf;
                    i += 2;
                } else {
                    o += c;
                }
            }
        }
    }
    return o;
}
}
