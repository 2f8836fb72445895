#include "patch/manifest.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace patchsync {
namespace {

std::vector<ManifestEntry> SampleEntries() {
    return {
        {"data/a.bin", std::string(64, 'a'), 1700000000},
        {"cfg/x.ini", std::string(64, 'b'), -5},
        {"launcher.exe", "", 0},
    };
}

TEST(ManifestTest, DeobfuscateIsItsOwnInverse) {
    std::vector<std::uint8_t> original(1000);
    for (size_t i = 0; i < original.size(); ++i)
        original[i] = static_cast<std::uint8_t>(i * 7);

    auto bytes = original;
    Deobfuscate(bytes, 0x69);
    EXPECT_NE(bytes, original);
    Deobfuscate(bytes, 0x69);
    EXPECT_EQ(bytes, original);
}

TEST(ManifestTest, DeobfuscateUsesRollingKey) {
    std::vector<std::uint8_t> zeros(300, 0);
    Deobfuscate(zeros, 0x69);

    EXPECT_EQ(zeros[0], 0x69);
    EXPECT_EQ(zeros[1], 0x6A);
    EXPECT_EQ(zeros[0x96], 0xFF);  // 150 + 105
    EXPECT_EQ(zeros[0x97], 0x00);  // wraps mod 256
    EXPECT_EQ(zeros[254], static_cast<std::uint8_t>(254 + 0x69));
    EXPECT_EQ(zeros[255], 0x69);   // index wraps mod 255
}

TEST(ManifestTest, DecodesEncodedManifest) {
    const auto entries = SampleEntries();
    const auto bytes = testutil::EncodeManifest(entries);

    auto m = ManifestDecoder{}.Decode(bytes);
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->declared_count, entries.size());
    EXPECT_EQ(m->entries, entries);
}

TEST(ManifestTest, DecodesObfuscatedWireBytes) {
    const auto entries = SampleEntries();
    const std::string wire = testutil::ObfuscatedManifest(entries);

    std::vector<std::uint8_t> bytes(wire.begin(), wire.end());
    Deobfuscate(bytes);
    auto m = ManifestDecoder{}.Decode(bytes);
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->entries, entries);
}

TEST(ManifestTest, EmptyManifest) {
    auto m = ManifestDecoder{}.Decode(testutil::EncodeManifest({}));
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->declared_count, 0u);
    EXPECT_TRUE(m->entries.empty());
}

TEST(ManifestTest, NormalizesWindowsSeparators) {
    auto m = ManifestDecoder{}.Decode(
        testutil::EncodeManifest({{"data\\maps\\m1.dat", "h", 1}}));
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->entries[0].path, "data/maps/m1.dat");
}

TEST(ManifestTest, TruncationIsStructuralError) {
    const auto full = testutil::EncodeManifest(SampleEntries());

    struct Case {
        size_t keep;
        const char* expected;
    };
    const Case cases[] = {
        {8, "header"},
        {18, "entry count"},
        {22, "entry 0 (path)"},
        {full.size() - 3, "entry 2 (timestamp)"},
    };
    for (const auto& c : cases) {
        std::vector<std::uint8_t> cut(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(c.keep));
        auto m = ManifestDecoder{}.Decode(cut);
        ASSERT_FALSE(m.has_value()) << "keep=" << c.keep;
        EXPECT_NE(m.error().find(c.expected), std::string::npos) << m.error();
    }
}

TEST(ManifestTest, DeclaredCountBeyondDataFails) {
    const auto bytes = testutil::EncodeManifest(SampleEntries(), 4);
    auto m = ManifestDecoder{}.Decode(bytes);
    ASSERT_FALSE(m.has_value());
    EXPECT_NE(m.error().find("entry 3"), std::string::npos) << m.error();
}

TEST(ManifestTest, RejectsUnsafeAndDuplicatePaths) {
    auto escape = ManifestDecoder{}.Decode(testutil::EncodeManifest({{"../../etc/passwd", "h", 1}}));
    ASSERT_FALSE(escape.has_value());
    EXPECT_NE(escape.error().find("unsafe path"), std::string::npos);

    auto dup = ManifestDecoder{}.Decode(
        testutil::EncodeManifest({{"a/b.bin", "h", 1}, {"a\\b.bin", "h", 2}}));
    ASSERT_FALSE(dup.has_value());
    EXPECT_NE(dup.error().find("duplicate path"), std::string::npos);
}

} // namespace
} // namespace patchsync
