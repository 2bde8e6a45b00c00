#pragma once
#include "wxdown/core/credential/CapturedSession.h"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace wxdown::core::credential {
// The persisted capture log. Mutations through one store object are
// serialised; another process writing the same file can still interleave.
class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path path);
    const std::filesystem::path& path() const { return path_; }

    // Read-modify-write of the whole list. False means no guaranteed change:
    // unreadable file, malformed content or failed write.
    bool remove_by_biz(const std::string& biz_id);
    // Current credentials; empty when the file is missing or malformed.
    std::vector<ParsedCredential> credentials() const;
private:
    std::filesystem::path path_;
    mutable std::mutex mu;
};

// One-shot form for callers without a store object.
bool remove_by_biz(const std::filesystem::path& store_path, const std::string& biz_id);
}
