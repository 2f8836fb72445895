#include "crypto/blake2b.hpp"

#include "io/file_reader.hpp"

#include <sodium.h>

#include <array>
#include <cstdint>
#include <mutex>
#include <vector>

namespace patchsync {

namespace {

bool EnsureSodiumInit() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() { init_ok = sodium_init() >= 0; });
    return init_ok;
}

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class Blake2bState final {
public:
    bool Init() {
        return EnsureSodiumInit() &&
               crypto_generichash_init(&state_, nullptr, 0, kContentHashBytes) == 0;
    }

    bool Update(std::span<const std::uint8_t> data) {
        if (data.empty()) return true;
        return crypto_generichash_update(&state_, data.data(), data.size()) == 0;
    }

    bool Final(std::array<std::uint8_t, kContentHashBytes>& out) {
        return crypto_generichash_final(&state_, out.data(), out.size()) == 0;
    }

private:
    crypto_generichash_state state_{};
};

} // namespace

std::string Blake2b256Hex(std::span<const std::uint8_t> data) {
    Blake2bState st;
    if (!st.Init() || !st.Update(data)) return {};
    std::array<std::uint8_t, kContentHashBytes> digest{};
    if (!st.Final(digest)) return {};
    return HexEncode(digest);
}

std::string Blake2b256Hex(IReader& reader) {
    Blake2bState st;
    if (!st.Init()) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!st.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }

    std::array<std::uint8_t, kContentHashBytes> digest{};
    if (!st.Final(digest)) return {};
    return HexEncode(digest);
}

Result Blake2b256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;
    out_hex = Blake2b256Hex(reader);
    if (out_hex.empty()) return Result::Fail(-1, "blake2b failed: " + path);
    return Result::Ok();
}

} // namespace patchsync
