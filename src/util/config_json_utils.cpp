#include "util/config_json_utils.hpp"

#include <fstream>
#include <optional>

namespace patchsync::config::detail {

namespace {

// Absent keys leave out untouched. A present key of the wrong type is an error.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer()) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

bool GetEndpoints(const nlohmann::json& j, std::vector<std::string>& out, std::string& err) {
    auto it = j.find("Endpoints");
    if (it == j.end())
        return true;
    if (!it->is_array() || it->empty()) {
        err = "Endpoints must be a non-empty array of URLs";
        return false;
    }

    std::vector<std::string> urls;
    urls.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            err = "Endpoints entries must be non-empty strings";
            return false;
        }
        std::string url = item.get<std::string>();
        if (url.back() != '/')
            url.push_back('/');
        urls.push_back(std::move(url));
    }
    out = std::move(urls);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, PatcherConfigFromFile& cfg, std::string& err) {
    if (!GetEndpoints(j, cfg.endpoints, err))
        return false;

    std::optional<std::string> manifest_name;
    if (!GetStringIfPresent(j, "ManifestName", manifest_name, err))
        return false;
    if (manifest_name) {
        if (manifest_name->empty()) {
            err = "ManifestName must not be empty";
            return false;
        }
        cfg.manifest_name = *manifest_name;
    }

    std::optional<std::uint64_t> key;
    if (!GetU64IfPresent(j, "ObfuscationKey", key, err))
        return false;
    if (key) {
        if (*key > 0xFF) {
            err = "ObfuscationKey must be within 0..255";
            return false;
        }
        cfg.obfuscation_key = static_cast<std::uint8_t>(*key);
    }

    std::optional<std::uint64_t> workers;
    if (!GetU64IfPresent(j, "Workers", workers, err))
        return false;
    if (workers) {
        if (*workers == 0) {
            err = "Workers must be at least 1";
            return false;
        }
        cfg.workers = *workers;
    }

    if (!GetU64IfPresent(j, "ProbeTimeoutMs", cfg.probe_timeout_ms, err))
        return false;

    std::optional<std::string> install_dir;
    if (!GetStringIfPresent(j, "InstallDirectory", install_dir, err))
        return false;
    if (install_dir && !install_dir->empty()) {
        cfg.install_directory = *install_dir;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err))
        return false;
    if (level) {
        LogLevel lvl{};
        if (!ParseLogLevel(*level, lvl)) {
            err = "unknown LogLevel '" + *level + "'";
            return false;
        }
        cfg.log_level = lvl;
    }

    return true;
}

} // namespace patchsync::config::detail
