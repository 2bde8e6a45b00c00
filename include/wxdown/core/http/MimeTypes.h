#pragma once
#include <string_view>
#include <filesystem>

namespace wxdown::core::http {
inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

// Fixed extension table, case-insensitive; unknown extensions get kDefaultMimeType.
std::string_view mime_type_for(const std::filesystem::path& file);
}
