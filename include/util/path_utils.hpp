#pragma once

#include <string>
#include <string_view>

namespace patchsync {

inline constexpr std::string_view kPartialSuffix = ".tmp";

// Normalize a manifest path to a clean relative form:
// - convert '\' separators to '/'
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeManifestPath(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    while (s.rfind("./", 0) == 0 || (!s.empty() && s.front() == '/')) {
        s.erase(0, s.front() == '/' ? 1 : 2);
    }

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// True for a non-empty relative path without any ".." segment.
inline bool IsSafeRelativePath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;

    while (!p.empty()) {
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos);
    }
    return true;
}

inline std::string JoinPath(std::string_view dir, std::string_view relative) {
    if (dir.empty()) return std::string(relative);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(relative);
    return out;
}

inline std::string PartialPathFor(std::string_view dest_path) {
    std::string out(dest_path);
    out.append(kPartialSuffix);
    return out;
}

// Mirror URL for a manifest path; manifests may carry Windows separators.
inline std::string UrlFor(std::string_view base_url, std::string_view manifest_path) {
    std::string out(base_url);
    for (char c : manifest_path) {
        out.push_back(c == '\\' ? '/' : c);
    }
    return out;
}

} // namespace patchsync
