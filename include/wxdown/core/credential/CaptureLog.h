#pragma once
#include "wxdown/core/credential/CapturedSession.h"
#include <string>
#include <vector>
#include <optional>

namespace wxdown::core::credential {
// The capture log is a JSON array of objects keyed
// biz / url / set_cookie / timestamp / nickname / round_head_img.
std::optional<std::vector<CapturedSession>> parse_capture_log(const std::string& json);
std::string serialize_capture_log(const std::vector<CapturedSession>& sessions);
}
