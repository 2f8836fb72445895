#pragma once
#include "util/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchsync::config {

// Mirrors probed when the config names none.
std::vector<std::string> DefaultEndpoints();

class PatcherConfigFromFile {
public:
    std::vector<std::string> endpoints;
    std::string manifest_name;
    std::uint8_t obfuscation_key = 0;

    std::optional<std::string> install_directory;
    std::optional<std::uint64_t> workers;
    std::optional<std::uint64_t> probe_timeout_ms;
    std::optional<LogLevel> log_level;

    PatcherConfigFromFile() { Reset(); }

    bool LoadFile(const std::string &path);

    void Reset();
};

} // namespace patchsync::config
