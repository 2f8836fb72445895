#include "patch/inventory_verifier.hpp"

#include "crypto/blake2b.hpp"
#include "io/file_ops.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <sys/stat.h>

namespace patchsync {

const char* ToString(LocalFileState state) {
    switch (state) {
        case LocalFileState::Missing:   return "missing";
        case LocalFileState::Stale:     return "stale";
        case LocalFileState::Protected: return "protected";
        case LocalFileState::UpToDate:  return "up-to-date";
    }
    return "unknown";
}

std::string InventoryVerifier::LocalPath(const ManifestEntry& entry) const {
    return JoinPath(install_dir_, entry.path);
}

LocalFileState InventoryVerifier::Classify(const ManifestEntry& entry) const {
    const std::string path = LocalPath(entry);

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return LocalFileState::Missing;
    }
    if (S_ISREG(st.st_mode) && (st.st_mode & 07777) == kProtectedMode) {
        return LocalFileState::Protected;
    }

    std::string actual;
    auto hash_result = Blake2b256HexFile(path, actual);
    if (!hash_result.is_ok()) {
        LogDebug("cannot hash %s: %s", path.c_str(), hash_result.message().c_str());
        return LocalFileState::Stale;
    }
    return actual == entry.content_hash ? LocalFileState::UpToDate : LocalFileState::Stale;
}

VerifyReport InventoryVerifier::Verify(const Manifest& manifest) const {
    VerifyReport report;

    for (const auto& entry : manifest.entries) {
        const LocalFileState state = Classify(entry);
        switch (state) {
            case LocalFileState::Missing:
                ++report.missing;
                report.to_fetch.push_back(entry);
                LogInfo("Checking %s: need to download", entry.path.c_str());
                break;
            case LocalFileState::Stale:
                ++report.stale;
                report.to_fetch.push_back(entry);
                LogInfo("Checking %s: need to download", entry.path.c_str());
                break;
            case LocalFileState::Protected:
                ++report.protected_files;
                LogInfo("Checking %s: file is custom (read-only), skipping", entry.path.c_str());
                break;
            case LocalFileState::UpToDate: {
                ++report.up_to_date;
                auto times = SetFileTimes(LocalPath(entry), entry.last_modified);
                if (!times.is_ok()) {
                    LogWarn("%s", times.message().c_str());
                }
                LogInfo("Checking %s: OK", entry.path.c_str());
                break;
            }
        }
    }

    return report;
}

} // namespace patchsync
