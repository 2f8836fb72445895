#include "patch/manifest_loader.hpp"

#include "util/logger.hpp"

#include <vector>

namespace patchsync {

Result ManifestLoader::Load(IHttpClient& http,
                            const Endpoint& endpoint,
                            const Options& opt,
                            Manifest& out_manifest) {
    const std::string url = endpoint.base_url + opt.manifest_name;

    std::string body;
    auto get_result = http.GetToString(url, body);
    if (!get_result.is_ok()) {
        return Result::Fail(get_result.err, "cannot fetch manifest: " + get_result.message());
    }

    std::vector<std::uint8_t> bytes(body.begin(), body.end());
    Deobfuscate(bytes, opt.obfuscation_key);

    auto decoded = ManifestDecoder{}.Decode(bytes);
    if (!decoded) {
        return Result::Fail(-1, "malformed manifest from " + url + ": " + decoded.error());
    }

    out_manifest = std::move(*decoded);
    LogInfo("Fetched version information for %u files from %s",
            out_manifest.declared_count,
            url.c_str());
    return Result::Ok();
}

} // namespace patchsync
