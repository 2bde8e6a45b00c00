#include "wxdown/core/credential/CredentialStore.h"
#include "wxdown/core/credential/CaptureLog.h"
#include "wxdown/core/credential/CredentialParser.h"
#include "wxdown/core/util/FileIo.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>

namespace wxdown::core::credential {
using util::log_error;
using util::log_info;
using util::log_warn;

namespace {
bool remove_locked(const std::filesystem::path& path, const std::string& biz_id) {
    std::string data;
    std::error_code ec;
    if (!util::read_file(path, data, ec)) {
        log_error(fmt::format("reading {} failed: {}", path.string(), ec.message()));
        return false;
    }
    auto sessions = parse_capture_log(data);
    if (!sessions) {
        log_warn(fmt::format("{} is not a valid session list, leaving it untouched", path.string()));
        return false;
    }
    auto before = sessions->size();
    sessions->erase(std::remove_if(sessions->begin(), sessions->end(),
                                   [&](const CapturedSession& s){ return s.bizId == biz_id; }),
                    sessions->end());
    if (!util::write_file_replace(path, serialize_capture_log(*sessions), ec)) {
        log_error(fmt::format("writing {} failed: {}", path.string(), ec.message()));
        return false;
    }
    log_info(fmt::format("removed {} capture(s) for biz {}", before - sessions->size(), biz_id));
    return true;
}
}

CredentialStore::CredentialStore(std::filesystem::path path) : path_(std::move(path)) {}

bool CredentialStore::remove_by_biz(const std::string& biz_id) {
    std::lock_guard lock(mu);
    return remove_locked(path_, biz_id);
}

std::vector<ParsedCredential> CredentialStore::credentials() const {
    std::string data;
    std::error_code ec;
    {
        std::lock_guard lock(mu);
        if (!util::read_file(path_, data, ec)) return {};
    }
    return extract_credentials(data);
}

bool remove_by_biz(const std::filesystem::path& store_path, const std::string& biz_id) {
    return remove_locked(store_path, biz_id);
}
}
