#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace patchsync {

// Unkeyed BLAKE2b with a 32-byte digest, the content hash mirrors publish.
inline constexpr std::size_t kContentHashBytes = 32;

// Lowercase hex digests; an empty string means the digest could not be computed.
std::string Blake2b256Hex(std::span<const std::uint8_t> data);
std::string Blake2b256Hex(IReader& reader);
Result Blake2b256HexFile(const std::string& path, std::string& out_hex);

} // namespace patchsync
