#include "HttpFetchClient.h"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <set>
#include <sstream>

#include <sys/socket.h>
#include <unistd.h>

namespace {

bool startsWithNoCase(const std::string& text, const char* prefix) {
    std::size_t n = std::char_traits<char>::length(prefix);
    if (text.size() < n)
        return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

struct HeaderInfo {
    std::uint64_t contentLength = 0;
    bool hasContentLength = false;
    std::uint64_t rangeTotal = 0;    // from "Content-Range: bytes a-b/total"
    bool hasRangeTotal = false;
    std::chrono::milliseconds retryAfter{ 0 };
};

// Header lines of every response in a redirect chain arrive here; the
// status line of a new response resets what was collected so far.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* info = static_cast<HeaderInfo*>(userdata);

    std::string header(buffer, total);

    try {
        if (startsWithNoCase(header, "HTTP/")) {
            *info = HeaderInfo();
        }
        else if (startsWithNoCase(header, "Content-Length:")) {
            info->contentLength = std::stoull(trim(header.substr(15)));
            info->hasContentLength = true;
        }
        else if (startsWithNoCase(header, "Content-Range:")) {
            auto slash = header.rfind('/');
            if (slash != std::string::npos) {
                std::string totalText = trim(header.substr(slash + 1));
                if (!totalText.empty() && totalText != "*") {
                    info->rangeTotal = std::stoull(totalText);
                    info->hasRangeTotal = true;
                }
            }
        }
        else if (startsWithNoCase(header, "Retry-After:")) {
            std::string value = trim(header.substr(12));
            // Only the delta-seconds form; an HTTP-date falls back to the floor.
            if (!value.empty() && std::all_of(value.begin(), value.end(), ::isdigit))
                info->retryAfter = std::chrono::seconds(std::stoll(value));
        }
    }
    catch (const std::exception&) {
        // Malformed numeric header: ignore it, the status code still decides.
    }

    return total;
}

FetchError fromCurlCode(CURLcode code) {
    FetchError err;
    err.message = curl_easy_strerror(code);

    switch (code) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_REMOTE_ACCESS_DENIED:
    case CURLE_LOGIN_DENIED:
    case CURLE_TOO_MANY_REDIRECTS:
        err.kind = ErrorKind::Fatal;
        break;
    default:
        err.kind = ErrorKind::Transient;
        break;
    }
    return err;
}

// Socket bookkeeping for one easy handle so another thread can sever the
// transfer: close() shuts down every socket curl opened, and the progress
// callback aborts phases that have no socket yet (name resolution).
class Severance {
public:
    void install(CURL* curl) {
        curl_easy_setopt(curl, CURLOPT_OPENSOCKETFUNCTION, &Severance::openSocket);
        curl_easy_setopt(curl, CURLOPT_OPENSOCKETDATA, this);
        curl_easy_setopt(curl, CURLOPT_CLOSESOCKETFUNCTION, &Severance::closeSocket);
        curl_easy_setopt(curl, CURLOPT_CLOSESOCKETDATA, this);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Severance::progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
    }

    void close() {
        closed.store(true);

        std::lock_guard<std::mutex> lock(socketMutex);
        for (curl_socket_t s : sockets)
            ::shutdown(s, SHUT_RDWR);
    }

    bool isClosed() const { return closed.load(); }

private:
    static curl_socket_t openSocket(void* clientp, curlsocktype, struct curl_sockaddr* address) {
        auto* self = static_cast<Severance*>(clientp);
        if (self->closed.load())
            return CURL_SOCKET_BAD;

        curl_socket_t s = ::socket(address->family, address->socktype, address->protocol);
        if (s == CURL_SOCKET_BAD)
            return s;

        std::lock_guard<std::mutex> lock(self->socketMutex);
        self->sockets.insert(s);
        if (self->closed.load())
            ::shutdown(s, SHUT_RDWR);
        return s;
    }

    static int closeSocket(void* clientp, curl_socket_t item) {
        auto* self = static_cast<Severance*>(clientp);
        {
            std::lock_guard<std::mutex> lock(self->socketMutex);
            self->sockets.erase(item);
        }
        return ::close(item);
    }

    static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<Severance*>(clientp);
        return self->closed.load() ? 1 : 0;
    }

private:
    std::atomic<bool> closed{ false };
    std::mutex socketMutex;
    std::set<curl_socket_t> sockets;
};

const FetchError kClosed{ ErrorKind::Cancelled, std::chrono::milliseconds(0), "transport closed" };

class CurlRangeStream : public RangeStream {
public:
    CurlRangeStream(CURL* handle, const std::string& u, std::uint64_t off, std::uint64_t len,
        const HttpFetchOptions& o)
        : curl(handle), url(u), offset(off), length(len), opts(o) {
    }

    ~CurlRangeStream() override {
        if (curl)
            curl_easy_cleanup(curl);
    }

    bool read(const DataCallback& onData, FetchError& err) override {
        if (severance.isClosed()) {
            err = kClosed;
            return false;
        }

        sink = &onData;
        statusRejected = false;
        receiverAborted = false;

        std::ostringstream range;
        range << offset << "-" << (offset + length - 1);
        const std::string rangeText = range.str();

        HeaderInfo headers;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_RANGE, rangeText.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connectTimeoutSec);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, opts.lowSpeedLimitBytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, opts.lowSpeedTimeSec);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlRangeStream::writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        severance.install(curl);

        CURLcode res = curl_easy_perform(curl);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        sink = nullptr;

        if (severance.isClosed()) {
            err = kClosed;
            return false;
        }

        if (statusRejected || (res == CURLE_OK && status != 206)) {
            err = HttpFetchClient::classifyStatus(status, headers.retryAfter);
            return false;
        }

        if (res != CURLE_OK) {
            if (receiverAborted) {
                err = { ErrorKind::Fatal, std::chrono::milliseconds(0), "transfer aborted by receiver" };
                return false;
            }
            err = fromCurlCode(res);
            return false;
        }

        return true;
    }

    void close() override {
        severance.close();
    }

private:
    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlRangeStream*>(userdata);
        std::size_t total = size * nmemb;

        long status = 0;
        curl_easy_getinfo(self->curl, CURLINFO_RESPONSE_CODE, &status);
        if (status != 206) {
            // Error page or full-body 200: never hand it to the part file.
            self->statusRejected = true;
            return 0;
        }

        if (!(*self->sink)(ptr, total)) {
            self->receiverAborted = true;
            return 0;
        }
        return total;
    }

private:
    CURL* curl;
    std::string url;
    std::uint64_t offset;
    std::uint64_t length;
    HttpFetchOptions opts;

    const DataCallback* sink = nullptr;
    bool statusRejected = false;
    bool receiverAborted = false;

    Severance severance;
};

// HEAD for Content-Length, falling back to a one-byte range request for
// servers that reject HEAD.
class CurlSizeQuery : public SizeQuery {
public:
    CurlSizeQuery(const std::string& u, const HttpFetchOptions& o)
        : url(u), opts(o) {
    }

    bool run(std::uint64_t& size, FetchError& err) override {
        if (severance.isClosed()) {
            err = kClosed;
            return false;
        }

        CURL* c = curl_easy_init();
        if (!c) {
            err = { ErrorKind::Transient, std::chrono::milliseconds(0), "curl_easy_init failed" };
            return false;
        }

        HeaderInfo headers;

        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_USERAGENT, opts.userAgent.c_str());
        curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, opts.connectTimeoutSec);
        curl_easy_setopt(c, CURLOPT_TIMEOUT, opts.connectTimeoutSec * 2);
        curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(c, CURLOPT_HEADERDATA, &headers);
        severance.install(c);

        CURLcode res = curl_easy_perform(c);
        long status = 0;
        curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

        if (!severance.isClosed() && (res != CURLE_OK || status >= 400 || !headers.hasContentLength)) {
            headers = HeaderInfo();
            curl_easy_setopt(c, CURLOPT_NOBODY, 0L);
            curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(c, CURLOPT_RANGE, "0-0");
            curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,
                static_cast<size_t(*)(char*, size_t, size_t, void*)>(
                    [](char*, size_t size, size_t nmemb, void*) -> size_t { return size * nmemb; }));

            res = curl_easy_perform(c);
            status = 0;
            curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
        }

        curl_easy_cleanup(c);

        if (severance.isClosed()) {
            err = kClosed;
            return false;
        }

        if (res != CURLE_OK) {
            err = fromCurlCode(res);
            return false;
        }

        if (status == 206 && headers.hasRangeTotal) {
            size = headers.rangeTotal;
            return true;
        }

        if (status == 200 && headers.hasContentLength) {
            size = headers.contentLength;
            return true;
        }

        if (status >= 400 || status == 0) {
            err = HttpFetchClient::classifyStatus(status, headers.retryAfter);
            return false;
        }

        err = { ErrorKind::Fatal, std::chrono::milliseconds(0), "remote size unknown" };
        return false;
    }

    void close() override {
        severance.close();
    }

private:
    std::string url;
    HttpFetchOptions opts;
    Severance severance;
};

}

HttpFetchClient::HttpFetchClient(const HttpFetchOptions& options)
    : opts(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpFetchClient::~HttpFetchClient() {
    curl_global_cleanup();
}

FetchError HttpFetchClient::classifyStatus(long status, std::chrono::milliseconds retryAfter) {
    FetchError err;
    err.message = "http status " + std::to_string(status);

    if (status == 429 || status == 503) {
        err.kind = ErrorKind::RateLimited;
        err.retryAfter = retryAfter;
    }
    else if (status == 0 || status == 408 || status >= 500) {
        err.kind = ErrorKind::Transient;
    }
    else if (status == 200) {
        err.kind = ErrorKind::Fatal;
        err.message = "server ignored the range request";
    }
    else {
        // 401/403/404/410/416 and the rest of 4xx
        err.kind = ErrorKind::Fatal;
    }
    return err;
}

std::unique_ptr<SizeQuery> HttpFetchClient::openSizeQuery(const std::string& url) {
    return std::make_unique<CurlSizeQuery>(url, opts);
}

std::unique_ptr<RangeStream> HttpFetchClient::openRangeStream(const std::string& url,
    std::uint64_t offset, std::uint64_t length, FetchError& err) {
    if (length == 0) {
        err = { ErrorKind::Fatal, std::chrono::milliseconds(0), "empty range" };
        return nullptr;
    }

    CURL* c = curl_easy_init();
    if (!c) {
        err = { ErrorKind::Transient, std::chrono::milliseconds(0), "curl_easy_init failed" };
        return nullptr;
    }

    return std::make_unique<CurlRangeStream>(c, url, offset, length, opts);
}
