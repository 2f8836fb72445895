#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace patchsync {

// SI units, e.g. 1536000 -> "1.5 MB".
inline std::string FormatBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB"};
    if (bytes < 1000) {
        return std::to_string(bytes) + " B";
    }
    double v = static_cast<double>(bytes);
    size_t unit = 0;
    while (v >= 1000.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        v /= 1000.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), v < 10.0 ? "%.1f %s" : "%.0f %s", v, kUnits[unit]);
    return buf;
}

} // namespace patchsync
