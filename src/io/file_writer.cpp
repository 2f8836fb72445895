// file_writer.cpp - Writer for partial downloads and installed files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patchsync {

Result FileWriter::Open(std::string path, Mode mode, FileWriter& out) {
    out.path_ = std::move(path);
    out.size_ = 0;

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == Mode::Append) ? O_APPEND : O_TRUNC;

    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    if (mode == Mode::Append) {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            return Result::Fail(errno,
                                "fstat failed: " + out.path_ + " (" + std::strerror(errno) + ")");
        }
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            size_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed: " + path_ + " (" + std::strerror(errno) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    const int fd = fd_.Release();
    if (::close(fd) == -1) {
        return Result::Fail(errno, "close failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

} // namespace patchsync
