#include "patch/endpoint_prober.hpp"

#include "util/logger.hpp"

namespace patchsync {

std::vector<Endpoint> EndpointProber::Probe(const std::vector<std::string>& candidates) const {
    std::vector<Endpoint> online;
    online.reserve(candidates.size());

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        long status = 0;
        auto res = http_.Head(candidates[i], status);
        if (!res.is_ok()) {
            LogDebug("endpoint %zu offline: %s", i, res.message().c_str());
            continue;
        }
        if (status != 200) {
            LogDebug("endpoint %zu offline: http %ld", i, status);
            continue;
        }
        LogDebug("endpoint %zu online: %s", i, candidates[i].c_str());
        online.push_back(Endpoint{i, candidates[i]});
    }

    return online;
}

} // namespace patchsync
