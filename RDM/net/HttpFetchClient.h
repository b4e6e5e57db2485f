#pragma once
#include <string>
#include <chrono>
#include "FetchClient.h"

struct HttpFetchOptions {
    long connectTimeoutSec = 30;
    long lowSpeedLimitBytes = 1024; // below this for lowSpeedTimeSec => stalled
    long lowSpeedTimeSec = 60;
    std::string userAgent = "rdm/1.0";
};

// FetchClient over libcurl; the locator is an http(s) URL.
class HttpFetchClient : public FetchClient {
public:
    explicit HttpFetchClient(const HttpFetchOptions& options = HttpFetchOptions());
    ~HttpFetchClient() override;

    std::unique_ptr<SizeQuery> openSizeQuery(const std::string& url) override;

    std::unique_ptr<RangeStream> openRangeStream(const std::string& url,
        std::uint64_t offset, std::uint64_t length, FetchError& err) override;

    // Maps an HTTP status to the engine's error kinds.
    static FetchError classifyStatus(long status, std::chrono::milliseconds retryAfter);

private:
    HttpFetchOptions opts;
};
