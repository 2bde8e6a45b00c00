#include "wxdown/core/credential/CaptureLog.h"
#include "wxdown/core/util/Json.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace wxdown::core::credential {
using util::JsonCursor;
using util::json_escape;

namespace {
// String fields accept a string or null.
bool read_text(JsonCursor& cur, std::string& out) {
    if (cur.peek() == 'n') { out.clear(); return cur.read_literal("null"); }
    auto s = cur.read_string();
    if (!s) return false;
    out = std::move(*s);
    return true;
}

// Largest magnitude a JavaScript Date can hold.
constexpr double kMaxTimestampMs = 8.64e15;

// Numbers outside the Date range are clamped to its edge. The raw text is kept
// so a rewrite reproduces exactly what the add-on wrote.
bool read_timestamp(JsonCursor& cur, int64_t& out, std::string& raw) {
    char c = cur.peek();
    if (c == 'n') {
        out = 0;
        if (!cur.read_literal("null")) return false;
        raw = "null";
        return true;
    }
    if (c != '-' && !std::isdigit(static_cast<unsigned char>(c))) return false;
    auto text = cur.skip_value();
    if (!text) return false;
    raw.assign(text->data(), text->size());
    double v = std::strtod(raw.c_str(), nullptr);
    if (std::isnan(v)) return false;
    v = std::clamp(v, -kMaxTimestampMs, kMaxTimestampMs);
    out = static_cast<int64_t>(v);
    return true;
}

std::optional<CapturedSession> read_session(JsonCursor& cur) {
    if (!cur.consume('{')) return std::nullopt;
    CapturedSession s;
    if (cur.consume('}')) return s;
    for (;;) {
        auto key = cur.read_string();
        if (!key || !cur.consume(':')) return std::nullopt;
        bool ok = true;
        if (*key == "biz") ok = read_text(cur, s.bizId);
        else if (*key == "url") ok = read_text(cur, s.pageUrl);
        else if (*key == "set_cookie") ok = read_text(cur, s.setCookieHeader);
        else if (*key == "timestamp") ok = read_timestamp(cur, s.capturedAtEpochMs, s.capturedAtRaw);
        else if (*key == "nickname") ok = read_text(cur, s.displayName);
        else if (*key == "round_head_img") ok = read_text(cur, s.avatarUrl);
        else {
            auto raw = cur.skip_value();
            ok = raw.has_value();
            if (ok) s.extraFields.emplace_back(std::move(*key), std::string(*raw));
        }
        if (!ok) return std::nullopt;
        if (cur.consume(',')) continue;
        if (cur.consume('}')) return s;
        return std::nullopt;
    }
}
}

std::optional<std::vector<CapturedSession>> parse_capture_log(const std::string& json) {
    JsonCursor cur(json);
    std::vector<CapturedSession> out;
    if (!cur.consume('[')) return std::nullopt;
    if (!cur.consume(']')) {
        for (;;) {
            auto s = read_session(cur);
            if (!s) return std::nullopt;
            out.push_back(std::move(*s));
            if (cur.consume(',')) continue;
            if (cur.consume(']')) break;
            return std::nullopt;
        }
    }
    if (!cur.at_end()) return std::nullopt;
    return out;
}

std::string serialize_capture_log(const std::vector<CapturedSession>& sessions) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& s : sessions) {
        if (!first) oss << ",";
        first = false;
        oss << "{\"biz\":\"" << json_escape(s.bizId) << "\""
            << ",\"url\":\"" << json_escape(s.pageUrl) << "\""
            << ",\"set_cookie\":\"" << json_escape(s.setCookieHeader) << "\""
            << ",\"timestamp\":";
        if (s.capturedAtRaw.empty()) oss << s.capturedAtEpochMs;
        else oss << s.capturedAtRaw;
        oss << ",\"nickname\":\"" << json_escape(s.displayName) << "\""
            << ",\"round_head_img\":\"" << json_escape(s.avatarUrl) << "\"";
        for (auto& [key, raw] : s.extraFields) oss << ",\"" << json_escape(key) << "\":" << raw;
        oss << "}";
    }
    oss << "]";
    return oss.str();
}
}
