#include "wxdown/core/credential/CredentialParser.h"
#include "wxdown/core/credential/CaptureLog.h"
#include "wxdown/core/util/Logger.h"
#include "wxdown/core/util/UrlCodec.h"
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <string_view>

namespace wxdown::core::credential {
using util::log_warn;

bool is_within_validity(int64_t captured_at_ms, std::chrono::system_clock::time_point now) {
    int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto window_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(kValidityWindow).count());
    if (captured_at_ms > now_ms) return true;
    // now_ms >= captured_at_ms, so the unsigned difference is exact.
    return static_cast<uint64_t>(now_ms) - static_cast<uint64_t>(captured_at_ms) < window_ms;
}

// Same match as /wap_sid2=(.+?);/: at least one character, none of them a
// line break, up to the next ';' after the first one.
std::optional<std::string> find_session_cookie(const std::string& set_cookie_header) {
    static constexpr std::string_view kName = "wap_sid2=";
    const std::string_view header = set_cookie_header;
    for (size_t at = header.find(kName); at != std::string_view::npos; at = header.find(kName, at + 1)) {
        size_t begin = at + kName.size();
        if (begin >= header.size() || header[begin] == '\n' || header[begin] == '\r') continue;
        size_t end = header.find_first_of(";\r\n", begin + 1);
        if (end == std::string_view::npos || header[end] != ';') continue;
        return std::string(header.substr(begin, end - begin));
    }
    return std::nullopt;
}

std::string proxied_avatar_url(const std::string& avatar_url) {
    if (avatar_url.empty()) return avatar_url;
    return fmt::format("{}?url={}", kAvatarProxyBase, util::encode_component(avatar_url));
}

std::string format_capture_time(int64_t epoch_ms) {
    int64_t secs = epoch_ms / 1000;
    if (epoch_ms % 1000 < 0) --secs;
    auto t = static_cast<std::time_t>(secs);
    std::tm tm{};
    if (!localtime_r(&t, &tm)) return {};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::optional<ParsedCredential> derive_credential(const CapturedSession& session, std::chrono::system_clock::time_point now) {
    auto params = util::parse_query(session.pageUrl);
    if (!params) return std::nullopt;
    auto biz = util::find_param(*params, "__biz");
    auto uin = util::find_param(*params, "uin");
    auto key = util::find_param(*params, "key");
    auto pass_ticket = util::find_param(*params, "pass_ticket");
    auto wap_sid2 = find_session_cookie(session.setCookieHeader);
    if (!biz || !uin || !key || !pass_ticket || !wap_sid2) return std::nullopt;

    ParsedCredential c;
    c.bizId = std::move(*biz);
    c.secretUin = std::move(*uin);
    c.secretKey = std::move(*key);
    c.passTicket = std::move(*pass_ticket);
    c.sessionCookieValue = std::move(*wap_sid2);
    c.displayName = session.displayName;
    c.avatarProxyUrl = proxied_avatar_url(session.avatarUrl);
    c.capturedAtFormatted = format_capture_time(session.capturedAtEpochMs);
    c.isValid = is_within_validity(session.capturedAtEpochMs, now);
    return c;
}

std::vector<ParsedCredential> extract_credentials(const std::string& raw_json_log, std::chrono::system_clock::time_point now) {
    std::vector<ParsedCredential> result;
    auto sessions = parse_capture_log(raw_json_log);
    if (!sessions) {
        log_warn("capture log is not a valid session list, ignoring it");
        return result;
    }
    std::stable_sort(sessions->begin(), sessions->end(), [](const CapturedSession& a, const CapturedSession& b) {
        return a.capturedAtEpochMs > b.capturedAtEpochMs;
    });
    for (const auto& s : *sessions) {
        if (auto c = derive_credential(s, now)) result.push_back(std::move(*c));
    }
    return result;
}

std::vector<ParsedCredential> extract_credentials(const std::string& raw_json_log) {
    return extract_credentials(raw_json_log, std::chrono::system_clock::now());
}
}
