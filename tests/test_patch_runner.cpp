#include "patch/patch_runner.hpp"

#include "crypto/blake2b.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace patchsync {
namespace {

std::string HashOf(const std::string& plain) {
    return Blake2b256Hex(testutil::Bytes(plain));
}

class PatchRunnerTest : public ::testing::Test {
  protected:
    const std::string kDown = "http://cdn0.test/";
    const std::string kUp = "http://cdn1.test/";

    testutil::TemporaryDirectory tmp;
    testutil::FakeServer server;
    PatchRunner runner{testutil::FakeHttpClient::Factory(server)};
    std::vector<ManifestEntry> entries;

    void SetUp() override { server.AddOnlineEndpoint(kUp); }

    PatchOptions Options() const {
        PatchOptions opt;
        opt.install_dir = tmp.Path();
        opt.candidate_endpoints = {kDown, kUp};
        opt.worker_count = 3;
        return opt;
    }

    void Publish(const std::string& path, const std::string& plain, std::int64_t mtime) {
        entries.push_back({path, HashOf(plain), mtime});
        server.Put(kUp + path, testutil::Gzip(plain));
    }

    void PublishManifest() { server.Put(kUp + "version.bin", testutil::ObfuscatedManifest(entries)); }

    bool InstallDirEmpty() const { return std::filesystem::is_empty(tmp.Path()); }
};

TEST_F(PatchRunnerTest, NoReachableEndpointAbortsBeforeManifestFetch) {
    testutil::FakeServer offline;
    PatchRunner r(testutil::FakeHttpClient::Factory(offline));

    PatchReport report;
    const auto res = r.Run(Options(), report);

    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(report.reachable_endpoints, 0u);
    EXPECT_EQ(offline.GetCount(), 0u);
    EXPECT_TRUE(InstallDirEmpty());
}

TEST_F(PatchRunnerTest, MissingInstallDirectoryIsFatal) {
    PublishManifest();
    auto opt = Options();
    opt.install_dir = tmp.Sub("does-not-exist");

    PatchReport report;
    EXPECT_FALSE(runner.Run(opt, report).is_ok());
    EXPECT_TRUE(server.Requests().empty());
}

TEST_F(PatchRunnerTest, MissingFileIsFetchedAndTimestamped) {
    const std::string content = testutil::Pattern(70000, 11);
    Publish("data/a.bin", content, 1700000000);
    PublishManifest();

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());

    EXPECT_EQ(report.reachable_endpoints, 1u);
    EXPECT_EQ(report.manifest_entries, 1u);
    EXPECT_EQ(report.queued, 1u);
    EXPECT_EQ(report.fetched, 1u);
    EXPECT_EQ(report.failed, 0u);

    const std::string dest = tmp.Sub("data/a.bin");
    std::string digest;
    ASSERT_TRUE(Blake2b256HexFile(dest, digest).is_ok());
    EXPECT_EQ(digest, entries[0].content_hash);
    EXPECT_EQ(testutil::MTime(dest), 1700000000);
    EXPECT_FALSE(testutil::Exists(dest + ".tmp"));
}

TEST_F(PatchRunnerTest, UpToDateFileIsNotDownloadedButRetimestamped) {
    const std::string content = "[main]\nkey=value\n";
    Publish("cfg/x.ini", content, 1600000000);
    PublishManifest();
    testutil::WriteFile(tmp.Sub("cfg/x.ini"), content);

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());

    EXPECT_EQ(report.up_to_date, 1u);
    EXPECT_EQ(report.queued, 0u);
    EXPECT_TRUE(server.Gets(kUp + "cfg/x.ini").empty());
    EXPECT_EQ(server.GetCount(), 1u);  // the manifest only
    EXPECT_EQ(testutil::MTime(tmp.Sub("cfg/x.ini")), 1600000000);
}

TEST_F(PatchRunnerTest, StaleFileIsReplaced) {
    const std::string content = testutil::Pattern(5000, 3);
    Publish("bin/tool", content, 1650000000);
    PublishManifest();
    testutil::WriteFile(tmp.Sub("bin/tool"), "old build");

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());
    EXPECT_EQ(report.fetched, 1u);
    EXPECT_EQ(testutil::ReadFile(tmp.Sub("bin/tool")), content);
}

TEST_F(PatchRunnerTest, SecondRunHasNothingToDo) {
    Publish("data/a.bin", testutil::Pattern(9000, 1), 1700000000);
    Publish("data/b.bin", testutil::Pattern(9000, 2), 1700000001);
    Publish("readme.txt", "hello\n", 1700000002);
    PublishManifest();

    PatchReport first;
    ASSERT_TRUE(runner.Run(Options(), first).is_ok());
    EXPECT_EQ(first.fetched, 3u);

    const size_t gets_after_first = server.GetCount();
    PatchReport second;
    ASSERT_TRUE(runner.Run(Options(), second).is_ok());
    EXPECT_EQ(second.queued, 0u);
    EXPECT_EQ(second.up_to_date, 3u);
    EXPECT_EQ(server.GetCount(), gets_after_first + 1);
}

TEST_F(PatchRunnerTest, ProtectedFileIsNeverWritten) {
    Publish("custom/skin.dat", "official skin", 1700000000);
    PublishManifest();
    const std::string path = tmp.Sub("custom/skin.dat");
    testutil::WriteFile(path, "my own skin");
    ASSERT_EQ(::chmod(path.c_str(), 0444), 0);
    const std::int64_t mtime_before = testutil::MTime(path);

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());

    EXPECT_EQ(report.protected_files, 1u);
    EXPECT_EQ(report.queued, 0u);
    EXPECT_TRUE(server.Gets(kUp + "custom/skin.dat").empty());
    EXPECT_EQ(testutil::ReadFile(path), "my own skin");
    EXPECT_EQ(testutil::MTime(path), mtime_before);
}

TEST_F(PatchRunnerTest, ManifestFetchFailureIsFatal) {
    PatchReport report;
    const auto res = runner.Run(Options(), report);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(report.reachable_endpoints, 1u);
    EXPECT_TRUE(InstallDirEmpty());
}

TEST_F(PatchRunnerTest, TruncatedManifestIsFatal) {
    Publish("data/a.bin", "payload", 1700000000);
    std::string wire = testutil::ObfuscatedManifest(entries);
    wire.resize(wire.size() - 5);
    server.Put(kUp + "version.bin", wire);

    PatchReport report;
    EXPECT_FALSE(runner.Run(Options(), report).is_ok());
    EXPECT_EQ(server.GetCount(), 1u);
    EXPECT_TRUE(InstallDirEmpty());
}

TEST_F(PatchRunnerTest, PerFileFailureDoesNotFailTheRun) {
    Publish("ok/one.bin", testutil::Pattern(2000, 1), 1700000000);
    Publish("broken/two.bin", testutil::Pattern(2000, 2), 1700000000);
    Publish("ok/three.bin", testutil::Pattern(2000, 3), 1700000000);
    PublishManifest();
    server.FailGets(kUp + "broken/two.bin", -1, 100);

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());
    EXPECT_EQ(report.queued, 3u);
    EXPECT_EQ(report.fetched, 2u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(server.Gets(kUp + "broken/two.bin").size(), 2u);
    EXPECT_FALSE(testutil::Exists(tmp.Sub("broken/two.bin")));
    EXPECT_TRUE(testutil::Exists(tmp.Sub("ok/three.bin")));
}

TEST_F(PatchRunnerTest, WorkersUseOnlyReachableEndpoints) {
    Publish("a", "1", 1);
    Publish("b", "2", 2);
    Publish("c", "3", 3);
    Publish("d", "4", 4);
    PublishManifest();

    PatchReport report;
    ASSERT_TRUE(runner.Run(Options(), report).is_ok());
    for (const auto& r : server.Requests()) {
        if (r.method == "GET") {
            EXPECT_EQ(r.url.rfind(kUp, 0), 0u) << r.url;
        }
    }
}

} // namespace
} // namespace patchsync
