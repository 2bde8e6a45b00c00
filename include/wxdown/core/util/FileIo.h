#pragma once
#include <string>
#include <string_view>
#include <filesystem>
#include <system_error>

namespace wxdown::core::util {
// Whole-file helpers reporting failures through ec (errno category).
bool read_file(const std::filesystem::path& path, std::string& out, std::error_code& ec);
// Writes to a sibling temporary file and renames it over path.
bool write_file_replace(const std::filesystem::path& path, std::string_view content, std::error_code& ec);
}
