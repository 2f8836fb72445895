#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace patchsync {

struct TransferProgressEvent {
    std::string_view path;
    std::uint64_t done = 0;                // bytes of the partial file, monotonic per attempt
    std::optional<std::uint64_t> total;    // unknown without a content length
    bool restart = false;                  // first event of an attempt; done may go backwards
};

// Called concurrently from fetch workers.
class ITransferProgress {
  public:
    virtual ~ITransferProgress() = default;
    virtual void OnTransferProgress(const TransferProgressEvent& e) = 0;
    virtual void OnTransferFinished(std::string_view path, bool ok) = 0;
};

} // namespace patchsync
