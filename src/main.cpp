#define _FILE_OFFSET_BITS 64

#include "net/http_client.hpp"
#include "patch/patch_runner.hpp"
#include "patch/progress_sinks.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <system_error>

namespace {

constexpr const char *kDefaultConfigPath = "patchsync.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-d <install dir>] [-j <workers>] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON config file (default ./patchsync.json, optional)\n"
        "  -d, --install-dir      Installation directory to reconcile (default: cwd)\n"
        "  -j, --workers          Parallel downloads (default: number of CPUs)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

bool ParseCount(const char *s, std::uint64_t &out) {
    char *end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (!end || *end != '\0' || v == 0) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool config_explicit = false;
    const char *install_dir_cli = nullptr;
    std::uint64_t workers_cli = 0;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"install-dir", required_argument, nullptr, 'd'},
        {"workers", required_argument, nullptr, 'j'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:j:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'd':
                install_dir_cli = optarg;
                break;

            case 'j':
                if (!ParseCount(optarg, workers_cli)) {
                    std::fprintf(stderr, "Invalid --workers: %s\n", optarg);
                    return 2;
                }
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    patchsync::config::PatcherConfigFromFile cfg;
    std::error_code ec;
    if (config_explicit || std::filesystem::exists(config_path, ec)) {
        if (!cfg.LoadFile(config_path)) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
            return 1;
        }
    } else {
        LogWarn("no config at %s, using built-in endpoints", config_path.c_str());
    }

    if (verbose) {
        patchsync::Logger::Instance().SetLevel(patchsync::LogLevel::Debug);
    } else if (cfg.log_level.has_value()) {
        patchsync::Logger::Instance().SetLevel(*cfg.log_level);
    }

    patchsync::PatchOptions opt;
    if (install_dir_cli) {
        opt.install_dir = install_dir_cli;
    } else if (cfg.install_directory.has_value()) {
        opt.install_dir = *cfg.install_directory;
    } else {
        opt.install_dir = std::filesystem::current_path(ec).string();
        if (ec) {
            std::fprintf(stderr, "ERROR: cannot determine working directory: %s\n",
                         ec.message().c_str());
            return 1;
        }
    }
    opt.candidate_endpoints = cfg.endpoints;
    opt.manifest.manifest_name = cfg.manifest_name;
    opt.manifest.obfuscation_key = cfg.obfuscation_key;
    if (workers_cli > 0) {
        opt.worker_count = static_cast<std::size_t>(workers_cli);
    } else if (cfg.workers.has_value()) {
        opt.worker_count = static_cast<std::size_t>(*cfg.workers);
    }

    patchsync::CurlOptions curl_opt;
    if (cfg.probe_timeout_ms.has_value()) {
        curl_opt.probe_timeout_ms = static_cast<long>(*cfg.probe_timeout_ms);
    }

    patchsync::ConsoleTransferProgress progress;
    patchsync::PatchRunner runner(patchsync::CurlHttpClient::Factory(curl_opt), &progress);

    patchsync::PatchReport report;
    auto res = runner.Run(opt, report);
    if (!res.ok) {
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return 1;
    }

    return 0;
}
