#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace patchsync {

// Sets both access and modification time to unix_seconds.
Result SetFileTimes(const std::string& path, std::int64_t unix_seconds);

Result EnsureParentDirectory(const std::string& path);

// Size of an existing regular file, nullopt when absent or not a regular file.
std::optional<std::uint64_t> RegularFileSize(const std::string& path);

Result RemoveFile(const std::string& path);

} // namespace patchsync
