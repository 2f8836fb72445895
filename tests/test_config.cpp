#include "testing.hpp"
#include "util/config_json_utils.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>

namespace patchsync::config {
namespace {

TEST(ConfigTest, DefaultsWithoutFile) {
    PatcherConfigFromFile cfg;
    EXPECT_EQ(cfg.endpoints.size(), 5u);
    EXPECT_EQ(cfg.endpoints.front(), "https://cdn0.burningsw.to/");
    EXPECT_EQ(cfg.manifest_name, "version.bin");
    EXPECT_EQ(cfg.obfuscation_key, 0x69);
    EXPECT_FALSE(cfg.workers.has_value());
}

TEST(ConfigTest, LoadsAllKeys) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Sub("patchsync.json"), R"({
        "Endpoints": ["http://mirror-a.local/patch", "http://mirror-b.local/"],
        "ManifestName": "files.bin",
        "ObfuscationKey": 7,
        "Workers": 3,
        "ProbeTimeoutMs": 250,
        "InstallDirectory": "/opt/game",
        "LogLevel": "Debug"
    })");

    PatcherConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(tmp.Sub("patchsync.json")));
    ASSERT_EQ(cfg.endpoints.size(), 2u);
    EXPECT_EQ(cfg.endpoints[0], "http://mirror-a.local/patch/");
    EXPECT_EQ(cfg.endpoints[1], "http://mirror-b.local/");
    EXPECT_EQ(cfg.manifest_name, "files.bin");
    EXPECT_EQ(cfg.obfuscation_key, 7);
    EXPECT_EQ(cfg.workers.value_or(0), 3u);
    EXPECT_EQ(cfg.probe_timeout_ms.value_or(0), 250u);
    EXPECT_EQ(cfg.install_directory.value_or(""), "/opt/game");
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, LogLevel::Debug);
}

TEST(ConfigTest, RejectsInvalidValues) {
    testutil::TemporaryDirectory tmp;
    const char* bad[] = {
        "not json",
        "[1, 2]",
        R"({"Endpoints": []})",
        R"({"Endpoints": [""]})",
        R"({"ObfuscationKey": 300})",
        R"({"Workers": 0})",
        R"({"LogLevel": "loud"})",
        R"({"ManifestName": ""})",
    };
    for (const char* text : bad) {
        testutil::WriteFile(tmp.Sub("c.json"), text);
        PatcherConfigFromFile cfg;
        EXPECT_FALSE(cfg.LoadFile(tmp.Sub("c.json"))) << text;
    }
}

TEST(ConfigTest, BadNumericValuesNameTheKey) {
    struct Case {
        const char* json;
        const char* key;
    };
    const Case cases[] = {
        {R"({"Workers": -2})", "Workers"},
        {R"({"Workers": 2.5})", "Workers"},
        {R"({"Workers": "4"})", "Workers"},
        {R"({"ObfuscationKey": -1})", "ObfuscationKey"},
        {R"({"ObfuscationKey": true})", "ObfuscationKey"},
        {R"({"ProbeTimeoutMs": 1.5})", "ProbeTimeoutMs"},
        {R"({"ProbeTimeoutMs": -100})", "ProbeTimeoutMs"},
        {R"({"ManifestName": 5})", "ManifestName"},
        {R"({"InstallDirectory": ["/opt"]})", "InstallDirectory"},
        {R"({"LogLevel": 2})", "LogLevel"},
    };
    for (const auto& c : cases) {
        PatcherConfigFromFile cfg;
        std::string err;
        EXPECT_FALSE(detail::FillConfigFromJson(nlohmann::json::parse(c.json), cfg, err)) << c.json;
        EXPECT_NE(err.find(c.key), std::string::npos) << c.json << " -> " << err;
    }
}

TEST(ConfigTest, AbsentKeysKeepDefaults) {
    PatcherConfigFromFile cfg;
    std::string err;
    ASSERT_TRUE(detail::FillConfigFromJson(nlohmann::json::object(), cfg, err)) << err;
    EXPECT_EQ(cfg.manifest_name, "version.bin");
    EXPECT_EQ(cfg.obfuscation_key, 0x69);
    EXPECT_FALSE(cfg.workers.has_value());
    EXPECT_FALSE(cfg.probe_timeout_ms.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, MissingFileFails) {
    testutil::TemporaryDirectory tmp;
    PatcherConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadFile(tmp.Sub("absent.json")));
}

TEST(ConfigTest, ParseLogLevelNames) {
    LogLevel lvl{};
    EXPECT_TRUE(ParseLogLevel("WARN", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("error", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
    EXPECT_FALSE(ParseLogLevel("verbose", lvl));
}

} // namespace
} // namespace patchsync::config
