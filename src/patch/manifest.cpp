#include "patch/manifest.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <unordered_set>

namespace patchsync {

namespace {

class ByteCursor {
public:
    explicit ByteCursor(std::span<const std::uint8_t> data) : data_(data) {}

    bool Skip(std::size_t n) {
        if (Remaining() < n) return false;
        pos_ += n;
        return true;
    }

    bool ReadU32(std::uint32_t& out) {
        if (Remaining() < 4) return false;
        out = 0;
        for (int i = 3; i >= 0; --i) {
            out = (out << 8) | data_[pos_ + static_cast<std::size_t>(i)];
        }
        pos_ += 4;
        return true;
    }

    bool ReadI64(std::int64_t& out) {
        if (Remaining() < 8) return false;
        std::uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | data_[pos_ + static_cast<std::size_t>(i)];
        }
        pos_ += 8;
        out = static_cast<std::int64_t>(v);
        return true;
    }

    bool ReadString(std::uint32_t len, std::string& out) {
        if (Remaining() < len) return false;
        out.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool ReadLengthPrefixed(std::string& out) {
        std::uint32_t len = 0;
        return ReadU32(len) && ReadString(len, out);
    }

private:
    std::size_t Remaining() const { return data_.size() - pos_; }

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

std::string Truncated(std::uint32_t index, const char* field) {
    return "manifest truncated at entry " + std::to_string(index) + " (" + field + ")";
}

} // namespace

void Deobfuscate(std::span<std::uint8_t> data, std::uint8_t key) {
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] ^= static_cast<std::uint8_t>(i % 0xFF + key);
    }
}

std::expected<Manifest, std::string> ManifestDecoder::Decode(
    std::span<const std::uint8_t> data) const {
    ByteCursor cur(data);

    if (!cur.Skip(kManifestHeaderSize)) {
        return std::unexpected("manifest truncated in header");
    }

    Manifest m;
    if (!cur.ReadU32(m.declared_count)) {
        return std::unexpected("manifest truncated in entry count");
    }

    // Each entry needs at least 16 bytes; do not trust the count for reserve().
    m.entries.reserve(std::min<std::size_t>(m.declared_count, data.size() / 16));

    std::unordered_set<std::string> seen;
    for (std::uint32_t i = 0; i < m.declared_count; ++i) {
        ManifestEntry e;
        if (!cur.ReadLengthPrefixed(e.path)) return std::unexpected(Truncated(i, "path"));
        if (!cur.ReadLengthPrefixed(e.content_hash)) return std::unexpected(Truncated(i, "hash"));
        if (!cur.ReadI64(e.last_modified)) return std::unexpected(Truncated(i, "timestamp"));

        e.path = NormalizeManifestPath(std::move(e.path));
        if (!IsSafeRelativePath(e.path)) {
            return std::unexpected("unsafe path in manifest entry " + std::to_string(i) + ": '" +
                                   e.path + "'");
        }
        if (!seen.insert(e.path).second) {
            return std::unexpected("duplicate path in manifest: " + e.path);
        }
        m.entries.push_back(std::move(e));
    }

    return m;
}

} // namespace patchsync
