#pragma once
#include <map>
#include <set>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <algorithm>
#include <chrono>
#include <memory>
#include <condition_variable>

#include "net/FetchClient.h"

inline FetchError fetchError(ErrorKind kind, const std::string& message,
    std::chrono::milliseconds retryAfter = std::chrono::milliseconds(0)) {
    FetchError err;
    err.kind = kind;
    err.message = message;
    err.retryAfter = retryAfter;
    return err;
}

// Deterministic bytes for a source of the given size.
inline std::string makeContent(std::size_t size, unsigned seed = 7) {
    std::string data(size, '\0');
    std::uint32_t x = seed * 2654435761u + 1;
    for (std::size_t i = 0; i < size; ++i) {
        x = x * 1664525u + 1013904223u;
        data[i] = static_cast<char>(x >> 24);
    }
    return data;
}

// In-memory scripted source. Every locator maps to a byte string; failures
// are queued per range offset, and stall mode makes every stream block
// until it is closed.
class FakeFetchClient : public FetchClient {
public:
    void addSource(const std::string& locator, const std::string& data) {
        std::lock_guard<std::mutex> lock(mtx);
        sources[locator] = data;
    }

    // The next `times` opens of the range starting at offset fail with err.
    void failRange(const std::string& locator, std::uint64_t offset, const FetchError& err, unsigned times = 1) {
        std::lock_guard<std::mutex> lock(mtx);
        for (unsigned i = 0; i < times; ++i)
            scripted[{ locator, offset }].push_back(err);
    }

    // Every open of the range fails until cleared.
    void failRangeAlways(const std::string& locator, std::uint64_t offset, const FetchError& err) {
        std::lock_guard<std::mutex> lock(mtx);
        permanent[{ locator, offset }] = err;
    }

    void clearFailures() {
        std::lock_guard<std::mutex> lock(mtx);
        scripted.clear();
        permanent.clear();
    }

    // The next stream for the range delivers only half its bytes and ends.
    void truncateRange(const std::string& locator, std::uint64_t offset) {
        std::lock_guard<std::mutex> lock(mtx);
        truncated.insert({ locator, offset });
    }

    void setStall(bool on) { stall.store(on); }

    // Size lookups block until closed.
    void setSizeQueryStall(bool on) { sizeQueryStall.store(on); }

    std::size_t sizeQueryCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return sizeQueries;
    }

    std::vector<std::uint64_t> fetchedOffsets() const {
        std::lock_guard<std::mutex> lock(mtx);
        auto out = opened;
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    std::size_t openCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return opened.size();
    }

    std::size_t activeStreams() const { return active.load(); }
    std::size_t peakStreams() const { return peak.load(); }

    std::unique_ptr<SizeQuery> openSizeQuery(const std::string& locator) override {
        std::lock_guard<std::mutex> lock(mtx);
        ++sizeQueries;

        auto it = sources.find(locator);
        if (it == sources.end())
            return std::make_unique<Query>(fetchError(ErrorKind::Fatal, "404 not found"), sizeQueryStall.load());
        return std::make_unique<Query>(it->second.size(), sizeQueryStall.load());
    }

    std::unique_ptr<RangeStream> openRangeStream(const std::string& locator,
        std::uint64_t offset, std::uint64_t length, FetchError& err) override {
        std::lock_guard<std::mutex> lock(mtx);
        opened.push_back(offset);

        auto src = sources.find(locator);
        if (src == sources.end()) {
            err.kind = ErrorKind::Fatal;
            err.message = "404 not found";
            return nullptr;
        }

        const Key key{ locator, offset };
        auto perm = permanent.find(key);
        if (perm != permanent.end()) {
            err = perm->second;
            return nullptr;
        }

        auto script = scripted.find(key);
        if (script != scripted.end() && !script->second.empty()) {
            err = script->second.front();
            script->second.erase(script->second.begin());
            return nullptr;
        }

        std::string body = src->second.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
        if (truncated.erase(key))
            body.resize(body.size() / 2);

        return std::make_unique<Stream>(*this, std::move(body), stall.load());
    }

private:
    using Key = std::pair<std::string, std::uint64_t>;

    class Query : public SizeQuery {
    public:
        Query(std::uint64_t total, bool stalled) : size(total), stall(stalled) {}
        Query(const FetchError& e, bool stalled) : error(e), failed(true), stall(stalled) {}

        bool run(std::uint64_t& out, FetchError& err) override {
            std::unique_lock<std::mutex> lock(mtx);
            if (stall)
                cv.wait(lock, [this]() { return closed; });
            if (closed) {
                err.kind = ErrorKind::Cancelled;
                err.message = "closed";
                return false;
            }
            if (failed) {
                err = error;
                return false;
            }
            out = size;
            return true;
        }

        void close() override {
            {
                std::lock_guard<std::mutex> lock(mtx);
                closed = true;
            }
            cv.notify_all();
        }

    private:
        std::uint64_t size = 0;
        FetchError error;
        bool failed = false;
        bool stall;
        std::mutex mtx;
        std::condition_variable cv;
        bool closed = false;
    };

    class Stream : public RangeStream {
    public:
        Stream(FakeFetchClient& owner, std::string body, bool stalled)
            : client(owner), data(std::move(body)), stall(stalled) {
        }

        bool read(const DataCallback& onData, FetchError& err) override {
            struct Active {
                FakeFetchClient& c;
                explicit Active(FakeFetchClient& fc) : c(fc) {
                    auto now = ++c.active;
                    auto prev = c.peak.load();
                    while (now > prev && !c.peak.compare_exchange_weak(prev, now)) {
                    }
                }
                ~Active() { --c.active; }
            } guard(client);

            if (stall) {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait(lock, [this]() { return closed; });
                err.kind = ErrorKind::Cancelled;
                err.message = "closed";
                return false;
            }

            const std::size_t chunk = 4096;
            for (std::size_t pos = 0; pos < data.size(); pos += chunk) {
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    if (closed) {
                        err.kind = ErrorKind::Cancelled;
                        err.message = "closed";
                        return false;
                    }
                }
                if (!onData(data.data() + pos, std::min(chunk, data.size() - pos))) {
                    err.kind = ErrorKind::Cancelled;
                    err.message = "aborted by callback";
                    return false;
                }
            }
            return true;
        }

        void close() override {
            {
                std::lock_guard<std::mutex> lock(mtx);
                closed = true;
            }
            cv.notify_all();
        }

    private:
        FakeFetchClient& client;
        std::string data;
        bool stall;
        std::mutex mtx;
        std::condition_variable cv;
        bool closed = false;
    };

    mutable std::mutex mtx;
    std::map<std::string, std::string> sources;
    std::map<Key, std::vector<FetchError>> scripted;
    std::map<Key, FetchError> permanent;
    std::set<Key> truncated;
    std::vector<std::uint64_t> opened;
    std::size_t sizeQueries = 0;
    std::atomic<bool> stall{ false };
    std::atomic<bool> sizeQueryStall{ false };
    std::atomic<std::size_t> active{ 0 };
    std::atomic<std::size_t> peak{ 0 };
};
