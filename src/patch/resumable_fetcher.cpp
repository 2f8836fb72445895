#include "patch/resumable_fetcher.hpp"

#include "io/file_ops.hpp"
#include "io/file_writer.hpp"
#include "patch/install_finalizer.hpp"
#include "util/byte_format.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace patchsync {

FetchOutcome ResumableFetcher::Fetch(const FetchJob& job) {
    FetchOutcome outcome;
    outcome.url = UrlFor(job.endpoint.base_url, job.entry.path);

    FetchPhase phase = FetchPhase::FreshOrResume;
    while (phase != FetchPhase::Done) {
        ++outcome.attempts;
        auto res = Attempt(job, outcome.url, phase);
        if (res.is_ok()) {
            outcome.ok = true;
            outcome.message.clear();
            break;
        }

        outcome.message = res.message();
        if (phase == FetchPhase::FreshOrResume) {
            LogWarn("%s (%s), retrying", res.message().c_str(), outcome.url.c_str());
            phase = FetchPhase::ForcedFresh;
        } else {
            LogError("Download for %s failed again, check manually: %s",
                     outcome.url.c_str(),
                     res.message().c_str());
            phase = FetchPhase::Done;
        }
    }

    if (progress_) progress_->OnTransferFinished(job.entry.path, outcome.ok);
    return outcome;
}

Result ResumableFetcher::Attempt(const FetchJob& job, const std::string& url, FetchPhase phase) {
    const std::string dest_path = JoinPath(install_dir_, job.entry.path);
    const std::string partial_path = PartialPathFor(dest_path);

    auto dir_result = EnsureParentDirectory(dest_path);
    if (!dir_result.is_ok()) return dir_result;

    const bool resume = phase == FetchPhase::FreshOrResume && RegularFileSize(partial_path).has_value();

    FileWriter partial;
    auto open_result = FileWriter::Open(
        partial_path, resume ? FileWriter::Mode::Append : FileWriter::Mode::Truncate, partial);
    if (!open_result.is_ok()) return open_result;

    const std::uint64_t offset = partial.Size();
    if (offset > 0) {
        LogInfo("Resuming %s from byte position %s.",
                job.entry.path.c_str(),
                FormatBytes(offset).c_str());
    }

    TransferObserver observer;
    if (progress_) {
        observer = [this, &job, offset](std::uint64_t received,
                                        std::optional<std::uint64_t> expected) {
            TransferProgressEvent e;
            e.path = job.entry.path;
            e.done = offset + received;
            if (expected) e.total = offset + *expected;
            progress_->OnTransferProgress(e);
        };
        TransferProgressEvent start;
        start.path = job.entry.path;
        start.done = offset;
        start.restart = true;
        progress_->OnTransferProgress(start);
    }

    auto get_result = http_.GetToWriter(url, offset, partial, observer);
    auto close_result = partial.Close();
    if (!get_result.is_ok()) return get_result;
    if (!close_result.is_ok()) return close_result;

    return InstallFinalizer::Install(partial_path, dest_path, job.entry.last_modified);
}

} // namespace patchsync
