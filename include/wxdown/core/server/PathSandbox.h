#pragma once
#include <filesystem>
#include <optional>
#include <string_view>

namespace wxdown::core::server {
// Maps a request target onto a file below root without touching the disk.
// Query and fragment are dropped, the path is percent-decoded and then
// normalised; nullopt when the result is not inside root or decoding fails.
// root must already be canonical.
std::optional<std::filesystem::path> resolve_in_root(const std::filesystem::path& root, std::string_view request_target);

// Component-wise prefix test on normalised paths ("/srv/a" does not contain "/srv/ab").
// A trailing separator on root is ignored; any ".." left in candidate fails.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Resolves symlinks in candidate and repeats the containment test.
std::optional<std::filesystem::path> confine_resolved(const std::filesystem::path& root, const std::filesystem::path& candidate);
}
