#include <gtest/gtest.h>

#include "net/HttpFetchClient.h"

using std::chrono::milliseconds;

TEST(HttpFetchClient, RateLimitStatusesCarryRetryHint) {
    for (long status : { 429L, 503L }) {
        FetchError err = HttpFetchClient::classifyStatus(status, milliseconds(7000));
        EXPECT_EQ(err.kind, ErrorKind::RateLimited) << status;
        EXPECT_EQ(err.retryAfter, milliseconds(7000)) << status;
    }
}

TEST(HttpFetchClient, ServerAndTimeoutStatusesAreTransient) {
    for (long status : { 0L, 408L, 500L, 502L, 504L }) {
        FetchError err = HttpFetchClient::classifyStatus(status, milliseconds(0));
        EXPECT_EQ(err.kind, ErrorKind::Transient) << status;
    }
}

TEST(HttpFetchClient, ClientErrorsAreFatal) {
    for (long status : { 401L, 403L, 404L, 410L, 416L }) {
        FetchError err = HttpFetchClient::classifyStatus(status, milliseconds(0));
        EXPECT_EQ(err.kind, ErrorKind::Fatal) << status;
        EXPECT_NE(err.message.find(std::to_string(status)), std::string::npos);
    }
}

TEST(HttpFetchClient, IgnoredRangeRequestIsFatal) {
    FetchError err = HttpFetchClient::classifyStatus(200, milliseconds(0));
    EXPECT_EQ(err.kind, ErrorKind::Fatal);
    EXPECT_NE(err.message.find("range"), std::string::npos);
}
