#include "wxdown/core/http/MimeTypes.h"
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace wxdown::core::http {
namespace {
constexpr std::pair<std::string_view, std::string_view> kTable[] = {
    { ".html", "text/html" },
    { ".js",   "text/javascript" },
    { ".css",  "text/css" },
    { ".json", "application/json" },
    { ".png",  "image/png" },
    { ".jpg",  "image/jpg" },
    { ".gif",  "image/gif" },
    { ".wav",  "audio/wav" },
    { ".mp4",  "video/mp4" },
    { ".woff", "application/font-woff" },
    { ".ttf",  "application/font-ttf" },
    { ".eot",  "application/vnd.ms-fontobject" },
    { ".otf",  "application/font-otf" },
    { ".svg",  "application/image/svg+xml" },
};
}

std::string_view mime_type_for(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    for (auto& [suffix, type] : kTable) {
        if (ext == suffix) return type;
    }
    return kDefaultMimeType;
}
}
