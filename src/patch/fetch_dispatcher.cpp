#include "patch/fetch_dispatcher.hpp"

#include "patch/resumable_fetcher.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <thread>

namespace patchsync {

std::optional<ManifestEntry> WorkQueue::Pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (items_.empty()) return std::nullopt;
    ManifestEntry e = std::move(items_.front());
    items_.pop_front();
    return e;
}

FetchDispatcher::FetchDispatcher(const RunConfig& config,
                                 HttpClientFactory client_factory,
                                 ITransferProgress* progress)
    : config_(config), client_factory_(std::move(client_factory)), progress_(progress) {}

DispatchSummary FetchDispatcher::Run(const std::vector<ManifestEntry>& queue) {
    DispatchSummary summary;
    if (queue.empty()) return summary;

    if (config_.endpoints.empty()) {
        for (const auto& e : queue) {
            summary.failed.push_back(FailedFetch{e.path, {}, "no reachable endpoint"});
        }
        return summary;
    }

    WorkQueue work(queue);
    const std::size_t workers =
        std::max<std::size_t>(1, std::min(config_.worker_count, queue.size()));
    LogInfo("Downloading %zu files with %zu workers over %zu endpoints",
            queue.size(),
            workers,
            config_.endpoints.size());

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t id = 0; id < workers; ++id) {
        threads.emplace_back([this, id, &work, &summary]() { WorkerLoop(id, work, summary); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return summary;
}

void FetchDispatcher::WorkerLoop(std::size_t worker_id,
                                 WorkQueue& queue,
                                 DispatchSummary& summary) {
    const Endpoint& endpoint = EndpointForWorker(config_.endpoints, worker_id);
    std::unique_ptr<IHttpClient> http = client_factory_();
    if (!http) {
        LogError("worker %zu has no http client", worker_id);
        while (auto entry = queue.Pop()) {
            std::lock_guard<std::mutex> lk(summary_mu_);
            summary.failed.push_back(FailedFetch{entry->path, {}, "no http client"});
        }
        return;
    }
    LogDebug("worker %zu bound to endpoint %zu (%s)",
             worker_id,
             endpoint.index,
             endpoint.base_url.c_str());

    ResumableFetcher fetcher(*http, config_.install_dir, progress_);
    while (auto entry = queue.Pop()) {
        FetchJob job{std::move(*entry), endpoint};
        const FetchOutcome outcome = fetcher.Fetch(job);

        std::lock_guard<std::mutex> lk(summary_mu_);
        if (outcome.ok) {
            ++summary.succeeded;
        } else {
            summary.failed.push_back(FailedFetch{job.entry.path, outcome.url, outcome.message});
        }
    }
}

} // namespace patchsync
