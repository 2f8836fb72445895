#pragma once

#include "net/http_client.hpp"
#include "patch/run_config.hpp"

#include <string>
#include <vector>

namespace patchsync {

class EndpointProber {
public:
    explicit EndpointProber(IHttpClient& http) : http_(http) {}

    // HEAD every candidate once, in order. Only endpoints answering 200 are kept;
    // failures are dropped without retry.
    std::vector<Endpoint> Probe(const std::vector<std::string>& candidates) const;

private:
    IHttpClient& http_;
};

} // namespace patchsync
