#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace patchsync {

class FileWriter final : public IWriter {
  public:
    enum class Mode {
        Truncate, // create or truncate to zero length
        Append,   // create or continue after existing content
    };

    static Result Open(std::string path, Mode mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // Closes the descriptor and reports deferred write errors.
    Result Close();

    // Size of the file when opened plus every byte written since.
    std::uint64_t Size() const { return size_; }
    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace patchsync
