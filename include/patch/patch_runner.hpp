#pragma once

#include "net/http_client.hpp"
#include "patch/manifest_loader.hpp"
#include "patch/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace patchsync {

struct PatchOptions {
    std::string install_dir;
    std::vector<std::string> candidate_endpoints;
    ManifestLoader::Options manifest;
    std::size_t worker_count = 0;  // 0 => hardware concurrency
};

struct PatchReport {
    std::size_t reachable_endpoints = 0;
    std::size_t manifest_entries = 0;
    std::size_t up_to_date = 0;
    std::size_t protected_files = 0;
    std::size_t queued = 0;
    std::size_t fetched = 0;
    std::size_t failed = 0;
};

// Probe -> manifest -> verify -> dispatch. A failed Result means the run was
// aborted (no endpoint, no manifest); files that could not be fetched are
// counted in the report but do not fail the run.
class PatchRunner {
public:
    explicit PatchRunner(HttpClientFactory client_factory, ITransferProgress* progress = nullptr);

    Result Run(const PatchOptions& opt, PatchReport& report);

private:
    HttpClientFactory client_factory_;
    ITransferProgress* progress_ = nullptr;
};

} // namespace patchsync
