#pragma once
#include "wxdown/core/credential/CapturedSession.h"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>

namespace wxdown::core::credential {
inline constexpr std::string_view kAvatarProxyBase = "https://thirsty-alligator-94.deno.dev";

// Turns the raw capture log into credentials, newest capture first. Records
// missing __biz, uin, key, pass_ticket or the wap_sid2 cookie are dropped.
// Malformed input yields an empty list.
std::vector<ParsedCredential> extract_credentials(const std::string& raw_json_log);
std::vector<ParsedCredential> extract_credentials(const std::string& raw_json_log, std::chrono::system_clock::time_point now);

// Single-record step of the pipeline; nullopt when a required value is missing.
std::optional<ParsedCredential> derive_credential(const CapturedSession& session, std::chrono::system_clock::time_point now);

bool is_within_validity(int64_t captured_at_ms, std::chrono::system_clock::time_point now);
std::optional<std::string> find_session_cookie(const std::string& set_cookie_header);
std::string proxied_avatar_url(const std::string& avatar_url);
// Local time as "YYYY-MM-DD HH:mm:ss".
std::string format_capture_time(int64_t epoch_ms);
}
