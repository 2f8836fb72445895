#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace patchsync {

struct Endpoint {
    std::size_t index = 0;  // position in the configured candidate list
    std::string base_url;   // ends with '/'
};

// Immutable per-run settings shared read-only by the coordinator and all workers.
struct RunConfig {
    std::string install_dir;
    std::vector<Endpoint> endpoints;  // reachable subset, candidate order preserved
    std::size_t worker_count = 1;
};

// Static round-robin binding fixed at worker creation; workers are never rebalanced.
// Requires a non-empty endpoint list.
inline const Endpoint& EndpointForWorker(const std::vector<Endpoint>& endpoints,
                                         std::size_t worker_id) {
    return endpoints[worker_id % endpoints.size()];
}

} // namespace patchsync
