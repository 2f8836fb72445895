#pragma once

#include "patch/manifest.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace patchsync {

enum class LocalFileState {
    Missing,
    Stale,      // content hash differs from the manifest
    Protected,  // user-owned file, never verified or overwritten
    UpToDate,
};

const char* ToString(LocalFileState state);

// Permission bits marking a file as user-customized.
inline constexpr unsigned kProtectedMode = 0444;

struct VerifyReport {
    std::vector<ManifestEntry> to_fetch;  // Missing and Stale, manifest order
    std::size_t missing = 0;
    std::size_t stale = 0;
    std::size_t protected_files = 0;
    std::size_t up_to_date = 0;
};

class InventoryVerifier {
public:
    explicit InventoryVerifier(std::string install_dir) : install_dir_(std::move(install_dir)) {}

    LocalFileState Classify(const ManifestEntry& entry) const;

    // Classifies every entry once. Up-to-date files get the manifest timestamp.
    VerifyReport Verify(const Manifest& manifest) const;

    std::string LocalPath(const ManifestEntry& entry) const;

private:
    std::string install_dir_;
};

} // namespace patchsync
