#pragma once

#include "patch/progress.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace patchsync {

class NullTransferProgress final : public ITransferProgress {
public:
    void OnTransferProgress(const TransferProgressEvent&) override {}
    void OnTransferFinished(std::string_view, bool) override {}
};

// Logs one line per transfer every min_step_bytes.
class ConsoleTransferProgress final : public ITransferProgress {
public:
    explicit ConsoleTransferProgress(std::uint64_t min_step_bytes = 4 * 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnTransferProgress(const TransferProgressEvent& e) override;
    void OnTransferFinished(std::string_view path, bool ok) override;

private:
    std::mutex mu_;
    std::uint64_t min_step_ = 0;
    std::unordered_map<std::string, std::uint64_t> next_;
};

} // namespace patchsync
