#include "patch/progress_sinks.hpp"

#include "util/byte_format.hpp"
#include "util/logger.hpp"

namespace patchsync {

void ConsoleTransferProgress::OnTransferProgress(const TransferProgressEvent& e) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto [it, inserted] = next_.try_emplace(std::string(e.path), 0);
        if (e.restart) it->second = 0;
        if (e.done < it->second) return;
        it->second = e.done + min_step_;
    }

    if (e.total && *e.total > 0) {
        int pct = (int)((e.done * 100ULL) / *e.total);
        if (pct > 100) pct = 100;
        LogInfo("[%.*s %d%%] %s / %s",
                (int)e.path.size(), e.path.data(),
                pct,
                FormatBytes(e.done).c_str(),
                FormatBytes(*e.total).c_str());
    } else {
        LogInfo("[%.*s] %s",
                (int)e.path.size(), e.path.data(),
                FormatBytes(e.done).c_str());
    }
}

void ConsoleTransferProgress::OnTransferFinished(std::string_view path, bool ok) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        next_.erase(std::string(path));
    }
    if (ok) {
        LogInfo("[%.*s] done", (int)path.size(), path.data());
    }
}

} // namespace patchsync
