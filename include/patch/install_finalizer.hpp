#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace patchsync {

class InstallFinalizer {
public:
    // Inflates the gzip payload of partial_path into dest_path, removes the
    // partial file and stamps dest_path with last_modified. A corrupt or
    // truncated payload leaves no destination file behind.
    static Result Install(const std::string& partial_path,
                          const std::string& dest_path,
                          std::int64_t last_modified);
};

} // namespace patchsync
