#include "util/config_parser.hpp"

#include "patch/manifest.hpp"
#include "util/config_json_utils.hpp"

namespace patchsync::config {

std::vector<std::string> DefaultEndpoints() {
    std::vector<std::string> out;
    for (int i = 0; i < 5; ++i) {
        out.push_back("https://cdn" + std::to_string(i) + ".burningsw.to/");
    }
    return out;
}

void PatcherConfigFromFile::Reset() {
    endpoints = DefaultEndpoints();
    manifest_name = "version.bin";
    obfuscation_key = kDefaultObfuscationKey;
    install_directory.reset();
    workers.reset();
    probe_timeout_ms.reset();
    log_level.reset();
}

bool PatcherConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogError("Config: %s", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        return false;
    }

    return true;
}

} // namespace patchsync::config
