#pragma once
#include <string>
#include <memory>
#include <cstdint>
#include <functional>
#include "../core/utils.h"

// One open byte-range transfer.
class RangeStream {
public:
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~RangeStream() = default;

    // Blocks delivering bytes until the range is exhausted (true) or the
    // transport fails (false, err filled). onData returning false aborts.
    virtual bool read(const DataCallback& onData, FetchError& err) = 0;

    // Callable from any thread at any time. Severs the transport so a
    // blocked read() returns promptly with ErrorKind::Cancelled.
    virtual void close() = 0;
};

// One size lookup for a locator whose length was not given at enqueue time.
class SizeQuery {
public:
    virtual ~SizeQuery() = default;

    // Blocks until the remote reports the total size (true) or the lookup
    // fails (false, err filled).
    virtual bool run(std::uint64_t& size, FetchError& err) = 0;

    // Same contract as RangeStream::close(): a blocked run() returns
    // promptly with ErrorKind::Cancelled.
    virtual void close() = 0;
};

class FetchClient {
public:
    virtual ~FetchClient() = default;

    virtual std::unique_ptr<SizeQuery> openSizeQuery(const std::string& locator) = 0;

    virtual std::unique_ptr<RangeStream> openRangeStream(const std::string& locator,
        std::uint64_t offset, std::uint64_t length, FetchError& err) = 0;
};
