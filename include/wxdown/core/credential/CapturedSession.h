#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <chrono>

namespace wxdown::core::credential {
// One observed article request, as written by the capture add-on.
struct CapturedSession {
    std::string bizId;
    std::string pageUrl;
    std::string setCookieHeader;
    int64_t capturedAtEpochMs{0};
    // Timestamp exactly as it appeared in the log; empty for sessions built in
    // code. Written back in place of capturedAtEpochMs when set.
    std::string capturedAtRaw;
    std::string displayName;
    std::string avatarUrl;
    // Unrecognised keys with their raw JSON value, kept for rewrite.
    std::vector<std::pair<std::string, std::string>> extraFields;
};

struct ParsedCredential {
    std::string bizId;
    std::string secretUin;
    std::string secretKey;
    std::string passTicket;
    std::string sessionCookieValue;
    std::string displayName;
    std::string avatarProxyUrl;
    std::string capturedAtFormatted;
    bool isValid{false};
};

inline constexpr std::chrono::minutes kValidityWindow{25};
}
