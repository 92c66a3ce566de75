#pragma once

#include "http_client.hpp"
#include "transport.hpp"

#include <atomic>
#include <string>

namespace osu_rankings {

/// Transport over HttpClient with exponential-backoff retry on transient
/// failures (network errors, HTTP 429 and 5xx).
class HttpTransport : public Transport {
public:
    struct Stats {
        int totalRequests = 0;
        int totalRetries  = 0;
    };

    HttpTransport(HttpClient& client, bool verbose = false);

    /// Routes the request and defers the round trip until the future is
    /// waited on.
    Pending<Json> submit(const Request& request) override;

    Stats getStats() const;

private:
    static constexpr int kMaxAttempts = 6;

    HttpClient&      mClient;
    bool             mVerbose;
    std::atomic<int> mTotalRequests{0};
    std::atomic<int> mTotalRetries{0};

    /// Execute a GET with exponential-backoff retry on transient failures.
    /// @throws ApiError for non-retryable statuses or when retries run out
    ///         on an error status.
    Json executeWithRetry(const std::string& target);

    static bool isRetryableStatus(unsigned int status);
};

} // namespace osu_rankings
