#pragma once

#include "net/http_client.hpp"
#include "patch/manifest.hpp"
#include "patch/progress.hpp"
#include "patch/run_config.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace patchsync {

struct FailedFetch {
    std::string path;
    std::string url;
    std::string message;
};

struct DispatchSummary {
    std::size_t succeeded = 0;
    std::vector<FailedFetch> failed;
};

// FIFO shared by all workers. Filled completely before any worker starts.
class WorkQueue {
public:
    explicit WorkQueue(const std::vector<ManifestEntry>& entries)
        : items_(entries.begin(), entries.end()) {}

    std::optional<ManifestEntry> Pop();

private:
    std::mutex mu_;
    std::deque<ManifestEntry> items_;
};

class FetchDispatcher {
public:
    FetchDispatcher(const RunConfig& config,
                    HttpClientFactory client_factory,
                    ITransferProgress* progress = nullptr);

    // Blocks until every entry reached a terminal state.
    DispatchSummary Run(const std::vector<ManifestEntry>& queue);

private:
    void WorkerLoop(std::size_t worker_id, WorkQueue& queue, DispatchSummary& summary);

    const RunConfig& config_;
    HttpClientFactory client_factory_;
    ITransferProgress* progress_ = nullptr;
    std::mutex summary_mu_;
};

} // namespace patchsync
