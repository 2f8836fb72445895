#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace patchsync {

struct ManifestEntry {
    std::string path;          // relative to the install directory, unique per manifest
    std::string content_hash;  // hex digest of the installed (decompressed) content
    std::int64_t last_modified = 0;  // unix seconds

    bool operator==(const ManifestEntry&) const = default;
};

struct Manifest {
    std::uint32_t declared_count = 0;
    std::vector<ManifestEntry> entries;
};

inline constexpr std::uint8_t kDefaultObfuscationKey = 0x69;
inline constexpr std::size_t kManifestHeaderSize = 16;

// XOR byte i with ((i mod 255) + key) mod 256, in place. Applying it twice
// restores the input. Obfuscation only: no secrecy or integrity.
void Deobfuscate(std::span<std::uint8_t> data, std::uint8_t key = kDefaultObfuscationKey);

// Decodes an already de-obfuscated manifest:
//   [16-byte reserved header][u32 LE count]
//   count x [u32 LE path len][path][u32 LE hash len][hash][i64 LE mtime]
// Entry paths are normalized; truncation, unsafe or duplicate paths are errors.
class ManifestDecoder {
public:
    std::expected<Manifest, std::string> Decode(std::span<const std::uint8_t> data) const;
};

} // namespace patchsync
