#pragma once

#include "net/http_client.hpp"
#include "patch/manifest.hpp"
#include "patch/run_config.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace patchsync {

class ManifestLoader {
public:
    struct Options {
        std::string manifest_name = "version.bin";
        std::uint8_t obfuscation_key = kDefaultObfuscationKey;
    };

    // Fetches <endpoint><manifest_name>, de-obfuscates and decodes it.
    // There is no failover: any failure here ends the run.
    static Result Load(IHttpClient& http,
                       const Endpoint& endpoint,
                       const Options& opt,
                       Manifest& out_manifest);
};

} // namespace patchsync
