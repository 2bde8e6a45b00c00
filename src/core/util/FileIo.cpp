#include "wxdown/core/util/FileIo.h"
#include <cerrno>
#include <cstdio>
#include <unistd.h>

namespace wxdown::core::util {
bool read_file(const std::filesystem::path& path, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { ec = std::error_code(errno, std::generic_category()); return false; }
    char buf[16384];
    for (;;) {
        size_t n = std::fread(buf, 1, sizeof(buf), f);
        if (n > 0) out.append(buf, n);
        if (n < sizeof(buf)) {
            if (std::ferror(f)) {
                ec = std::error_code(errno ? errno : EIO, std::generic_category());
                std::fclose(f);
                out.clear();
                return false;
            }
            break;
        }
    }
    std::fclose(f);
    return true;
}

bool write_file_replace(const std::filesystem::path& path, std::string_view content, std::error_code& ec) {
    ec.clear();
    auto tmp = path;
    tmp += ".tmp" + std::to_string(::getpid());
    FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) { ec = std::error_code(errno, std::generic_category()); return false; }
    bool ok = std::fwrite(content.data(), 1, content.size(), f) == content.size();
    if (!ok) ec = std::error_code(errno ? errno : EIO, std::generic_category());
    if (std::fclose(f) != 0 && ok) { ok = false; ec = std::error_code(errno, std::generic_category()); }
    if (!ok) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return false;
    }
    return true;
}
}
