#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace patchsync {

// Bytes received by the current request and the body length announced by the server.
using TransferObserver =
    std::function<void(std::uint64_t received, std::optional<std::uint64_t> expected)>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Reachability check without a body; `status` receives the final HTTP status.
    virtual Result Head(const std::string& url, long& status) = 0;

    virtual Result GetToString(const std::string& url, std::string& body) = 0;

    // Streams the body into `sink`. A non-zero offset sends "Range: bytes=<offset>-"
    // and anything but a 206 answer fails before a single byte reaches the sink.
    virtual Result GetToWriter(const std::string& url,
                               std::uint64_t offset,
                               IWriter& sink,
                               const TransferObserver& observer) = 0;
};

// Every worker gets its own client, hence its own connection.
using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

struct CurlOptions {
    long probe_timeout_ms = 5000;
    long connect_timeout_ms = 15000;
    std::string user_agent = "patchsync/1.0";
};

class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(CurlOptions opt = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result Head(const std::string& url, long& status) override;
    Result GetToString(const std::string& url, std::string& body) override;
    Result GetToWriter(const std::string& url,
                       std::uint64_t offset,
                       IWriter& sink,
                       const TransferObserver& observer) override;

    static HttpClientFactory Factory(CurlOptions opt);

private:
    Result Prepare(const std::string& url);

    CurlOptions opt_;
    CURL* handle_ = nullptr;
};

} // namespace patchsync
