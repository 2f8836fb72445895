#pragma once

#include "net/http_client.hpp"
#include "patch/manifest.hpp"
#include "patch/progress.hpp"
#include "patch/run_config.hpp"
#include "util/result.hpp"

#include <string>

namespace patchsync {

struct FetchJob {
    ManifestEntry entry;
    Endpoint endpoint;
};

// Per-file transfer state machine. Each phase is one attempt, so a file is
// requested at most twice per run:
//   FreshOrResume --fail--> ForcedFresh --fail--> Done (failed)
//        |                       |
//        +-------ok-------> Done (ok) <----ok----+
enum class FetchPhase {
    FreshOrResume,  // continue an existing <path>.tmp with a range request
    ForcedFresh,    // discard the partial file, request from byte 0
    Done,
};

struct FetchOutcome {
    bool ok = false;
    int attempts = 0;
    std::string url;
    std::string message;  // last failure
};

class ResumableFetcher {
public:
    ResumableFetcher(IHttpClient& http, std::string install_dir, ITransferProgress* progress)
        : http_(http), install_dir_(std::move(install_dir)), progress_(progress) {}

    FetchOutcome Fetch(const FetchJob& job);

    static constexpr int kMaxAttempts = 2;

private:
    Result Attempt(const FetchJob& job, const std::string& url, FetchPhase phase);

    IHttpClient& http_;
    std::string install_dir_;
    ITransferProgress* progress_ = nullptr;
};

} // namespace patchsync
