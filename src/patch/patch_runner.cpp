#include "patch/patch_runner.hpp"

#include "patch/endpoint_prober.hpp"
#include "patch/fetch_dispatcher.hpp"
#include "patch/inventory_verifier.hpp"
#include "util/logger.hpp"

#include <sys/stat.h>
#include <thread>

namespace patchsync {

namespace {

std::size_t ResolveWorkerCount(std::size_t requested) {
    if (requested > 0) return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

bool IsDirectory(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace

PatchRunner::PatchRunner(HttpClientFactory client_factory, ITransferProgress* progress)
    : client_factory_(std::move(client_factory)), progress_(progress) {}

Result PatchRunner::Run(const PatchOptions& opt, PatchReport& report) {
    report = PatchReport{};

    if (!IsDirectory(opt.install_dir)) {
        return Result::Fail(-1, "install directory does not exist: " + opt.install_dir);
    }

    std::unique_ptr<IHttpClient> http = client_factory_();
    if (!http) return Result::Fail(-1, "cannot create http client");

    RunConfig config;
    config.install_dir = opt.install_dir;
    config.worker_count = ResolveWorkerCount(opt.worker_count);
    config.endpoints = EndpointProber(*http).Probe(opt.candidate_endpoints);
    report.reachable_endpoints = config.endpoints.size();
    if (config.endpoints.empty()) {
        return Result::Fail(-1, "There are no download servers online.");
    }
    LogInfo("%zu of %zu download servers online",
            config.endpoints.size(),
            opt.candidate_endpoints.size());

    Manifest manifest;
    auto manifest_result = ManifestLoader::Load(*http, config.endpoints.front(), opt.manifest, manifest);
    if (!manifest_result.is_ok()) return manifest_result;
    report.manifest_entries = manifest.entries.size();

    const VerifyReport verified = InventoryVerifier(config.install_dir).Verify(manifest);
    report.up_to_date = verified.up_to_date;
    report.protected_files = verified.protected_files;
    report.queued = verified.to_fetch.size();
    LogInfo("Found %zu files that need to be updated.", verified.to_fetch.size());

    FetchDispatcher dispatcher(config, client_factory_, progress_);
    const DispatchSummary summary = dispatcher.Run(verified.to_fetch);
    report.fetched = summary.succeeded;
    report.failed = summary.failed.size();

    for (const auto& f : summary.failed) {
        LogError("Not updated: %s (%s): %s", f.path.c_str(), f.url.c_str(), f.message.c_str());
    }
    LogInfo("Update finished: %zu fetched, %zu failed, %zu up to date, %zu protected",
            report.fetched,
            report.failed,
            report.up_to_date,
            report.protected_files);
    return Result::Ok();
}

} // namespace patchsync
