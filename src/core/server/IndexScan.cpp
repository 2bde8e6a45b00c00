#include "wxdown/core/server/IndexScan.h"
#include <algorithm>

namespace wxdown::core::server {
namespace fs = std::filesystem;

std::vector<fs::path> find_index_html_files(const fs::path& dir) {
    std::vector<fs::path> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return found;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->path().filename() == "index.html" && it->is_regular_file(type_ec)) {
            found.push_back(it->path().lexically_relative(dir));
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}
}
