#include "wxdown/core/server/PathSandbox.h"
#include "wxdown/core/util/UrlCodec.h"
#include <string>

namespace wxdown::core::server {
namespace fs = std::filesystem;

bool is_within(const fs::path& root, const fs::path& candidate) {
    auto c = candidate.begin();
    for (const auto& part : root) {
        // trailing separator
        if (part.empty()) continue;
        if (c == candidate.end() || part != *c) return false;
        ++c;
    }
    for (; c != candidate.end(); ++c) {
        if (*c == "..") return false;
    }
    return true;
}

std::optional<fs::path> resolve_in_root(const fs::path& root, std::string_view request_target) {
    auto scheme = request_target.find("://");
    if (scheme != std::string_view::npos) {
        auto slash = request_target.find('/', scheme + 3);
        request_target = slash == std::string_view::npos ? std::string_view("/") : request_target.substr(slash);
    }
    auto cut = request_target.find_first_of("?#");
    if (cut != std::string_view::npos) request_target = request_target.substr(0, cut);

    auto decoded = util::decode_component(request_target);
    if (!decoded) return std::nullopt;
    if (decoded->find('\0') != std::string::npos) return std::nullopt;

    std::string_view relative = *decoded;
    while (!relative.empty() && relative.front() == '/') relative.remove_prefix(1);

    fs::path joined = (root / fs::path(std::string(relative))).lexically_normal();
    if (!is_within(root, joined)) return std::nullopt;
    return joined;
}

std::optional<fs::path> confine_resolved(const fs::path& root, const fs::path& candidate) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) return std::nullopt;
    if (!is_within(root, resolved)) return std::nullopt;
    return resolved;
}
}
