#include "net/http_client.hpp"

#include "util/logger.hpp"

#include <mutex>
#include <span>

namespace patchsync {

namespace {

bool EnsureCurlGlobalInit() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() {
        init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    });
    return init_ok;
}

bool IsSuccessStatus(long code) {
    return code >= 200 && code < 300;
}

struct StringSink {
    std::string* body = nullptr;
};

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<StringSink*>(userdata);
    const size_t count = size * nmemb;
    sink->body->append(ptr, count);
    return count;
}

struct WriterContext {
    CURL* handle = nullptr;
    IWriter* sink = nullptr;
    const TransferObserver* observer = nullptr;
    std::uint64_t offset = 0;
    std::uint64_t received = 0;
    bool status_checked = false;
    Result error = Result::Ok();
};

std::optional<std::uint64_t> AnnouncedLength(CURL* handle) {
    curl_off_t len = -1;
    if (curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK || len < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(len);
}

size_t WriteToWriter(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriterContext*>(userdata);
    const size_t count = size * nmemb;

    if (!ctx->status_checked) {
        long code = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
        if (ctx->offset > 0 && code != 206) {
            ctx->error = Result::Fail(-1, "range not honored (http " + std::to_string(code) + ")");
            return 0;
        }
        ctx->status_checked = true;
    }

    auto wr = ctx->sink->WriteAll(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), count));
    if (!wr.is_ok()) {
        ctx->error = wr;
        return 0;
    }

    ctx->received += count;
    if (ctx->observer && *ctx->observer) {
        (*ctx->observer)(ctx->received, AnnouncedLength(ctx->handle));
    }
    return count;
}

Result TransferFailure(const std::string& url, CURLcode rc, long code) {
    std::string msg = url + ": " + curl_easy_strerror(rc);
    if (code > 0) msg += " (http " + std::to_string(code) + ")";
    return Result::Fail(static_cast<int>(rc), msg);
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlOptions opt) : opt_(std::move(opt)) {}

CurlHttpClient::~CurlHttpClient() {
    if (handle_) curl_easy_cleanup(handle_);
}

HttpClientFactory CurlHttpClient::Factory(CurlOptions opt) {
    return [opt]() -> std::unique_ptr<IHttpClient> {
        return std::make_unique<CurlHttpClient>(opt);
    };
}

Result CurlHttpClient::Prepare(const std::string& url) {
    if (!EnsureCurlGlobalInit()) {
        return Result::Fail(-1, "curl global init failed");
    }
    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) return Result::Fail(-1, "curl_easy_init failed");
    } else {
        // Keeps the connection cache, drops per-request options.
        curl_easy_reset(handle_);
    }

    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(handle_, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS, opt_.connect_timeout_ms);
    return Result::Ok();
}

Result CurlHttpClient::Head(const std::string& url, long& status) {
    status = 0;
    auto prep = Prepare(url);
    if (!prep.is_ok()) return prep;

    curl_easy_setopt(handle_, CURLOPT_NOBODY, 1L);
    if (opt_.probe_timeout_ms > 0) {
        curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, opt_.probe_timeout_ms);
        curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS, opt_.probe_timeout_ms);
    }

    const CURLcode rc = curl_easy_perform(handle_);
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
    if (rc != CURLE_OK) return TransferFailure(url, rc, status);
    return Result::Ok();
}

Result CurlHttpClient::GetToString(const std::string& url, std::string& body) {
    body.clear();
    auto prep = Prepare(url);
    if (!prep.is_ok()) return prep;

    StringSink sink{&body};
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &sink);

    const CURLcode rc = curl_easy_perform(handle_);
    long code = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
    if (rc != CURLE_OK) return TransferFailure(url, rc, code);
    if (!IsSuccessStatus(code)) {
        return Result::Fail(-1, url + ": unexpected http status " + std::to_string(code));
    }
    LogDebug("GET %s -> %zu bytes", url.c_str(), body.size());
    return Result::Ok();
}

Result CurlHttpClient::GetToWriter(const std::string& url,
                                   std::uint64_t offset,
                                   IWriter& sink,
                                   const TransferObserver& observer) {
    auto prep = Prepare(url);
    if (!prep.is_ok()) return prep;

    WriterContext ctx;
    ctx.handle = handle_;
    ctx.sink = &sink;
    ctx.observer = &observer;
    ctx.offset = offset;

    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, WriteToWriter);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &ctx);
    if (offset > 0) {
        curl_easy_setopt(handle_, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
    }

    const CURLcode rc = curl_easy_perform(handle_);
    long code = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
    if (!ctx.error.is_ok()) {
        return Result::Fail(ctx.error.err, url + ": " + ctx.error.msg);
    }
    if (rc != CURLE_OK) return TransferFailure(url, rc, code);
    if (offset > 0 && code != 206) {
        return Result::Fail(-1, url + ": range not honored (http " + std::to_string(code) + ")");
    }
    if (!IsSuccessStatus(code)) {
        return Result::Fail(-1, url + ": unexpected http status " + std::to_string(code));
    }
    return Result::Ok();
}

} // namespace patchsync
