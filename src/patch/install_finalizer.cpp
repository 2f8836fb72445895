#include "patch/install_finalizer.hpp"

#include "io/file_ops.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace patchsync {

namespace {

Result Inflate(IReader& source, FileWriter& dest) {
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = source.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "corrupt or truncated compressed payload");
        auto wr = dest.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;
    }
    auto fr = dest.FsyncNow();
    if (!fr.is_ok()) return fr;
    return dest.Close();
}

} // namespace

Result InstallFinalizer::Install(const std::string& partial_path,
                                 const std::string& dest_path,
                                 std::int64_t last_modified) {
    auto input = std::make_unique<FileReader>();
    auto open_result = FileReader::Open(partial_path, *input);
    if (!open_result.is_ok()) return open_result;

    std::unique_ptr<IReader> payload;
    try {
        payload = std::make_unique<GzipReader>(std::move(input));
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("Gzip init failed: ") + e.what());
    }

    FileWriter dest;
    auto dest_result = FileWriter::Open(dest_path, FileWriter::Mode::Truncate, dest);
    if (!dest_result.is_ok()) return dest_result;

    auto inflate_result = Inflate(*payload, dest);
    if (!inflate_result.is_ok()) {
        (void)dest.Close();
        auto rm = RemoveFile(dest_path);
        if (!rm.is_ok()) LogWarn("%s", rm.message().c_str());
        return Result::Fail(inflate_result.err,
                            "decompress " + partial_path + " failed: " + inflate_result.message());
    }

    // Release the partial file before deleting it.
    payload.reset();
    auto rm = RemoveFile(partial_path);
    if (!rm.is_ok()) return rm;

    return SetFileTimes(dest_path, last_modified);
}

} // namespace patchsync
