#include "io/file_ops.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace patchsync {

Result SetFileTimes(const std::string& path, std::int64_t unix_seconds) {
    struct timespec times[2]{};
    times[0].tv_sec = static_cast<time_t>(unix_seconds);
    times[1].tv_sec = static_cast<time_t>(unix_seconds);
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) == -1) {
        return Result::Fail(errno,
                            "cannot set times on " + path + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result EnsureParentDirectory(const std::string& path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return Result::Ok();

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "cannot create directory " + parent.string() + " (" + ec.message() + ")");
    }
    return Result::Ok();
}

std::optional<std::uint64_t> RegularFileSize(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

Result RemoveFile(const std::string& path) {
    if (::unlink(path.c_str()) == -1 && errno != ENOENT) {
        return Result::Fail(errno, "cannot remove " + path + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

} // namespace patchsync
