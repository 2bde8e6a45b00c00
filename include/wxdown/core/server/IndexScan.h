#pragma once
#include <filesystem>
#include <vector>

namespace wxdown::core::server {
// Paths (relative to dir, sorted) of every index.html below dir. Unreadable
// subtrees are skipped.
std::vector<std::filesystem::path> find_index_html_files(const std::filesystem::path& dir);
}
