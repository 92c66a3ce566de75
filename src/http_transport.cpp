#include "http_transport.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace osu_rankings {

HttpTransport::HttpTransport(HttpClient& client, bool verbose)
    : mClient(client)
    , mVerbose(verbose) {}

Pending<Json> HttpTransport::submit(const Request& request)
{
    return std::async(std::launch::deferred,
                      [this, target = routeRequest(request)] {
                          return executeWithRetry(target);
                      });
}

HttpTransport::Stats HttpTransport::getStats() const
{
    Stats stats;
    stats.totalRequests = mTotalRequests.load();
    stats.totalRetries  = mTotalRetries.load();
    return stats;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

Json HttpTransport::executeWithRetry(const std::string& target)
{
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const bool lastAttempt = (attempt == kMaxAttempts - 1);

        HttpClient::Response resp;
        try {
            resp = mClient.get(target);
        } catch (const std::runtime_error& e) {
            // Network / timeout — retryable.
            ++mTotalRetries;

            if (mVerbose) {
                std::cerr << "[Retry] Network error: " << e.what()
                          << " (attempt " << (attempt + 1) << "/"
                          << kMaxAttempts << ")\n";
            }

            if (lastAttempt) {
                throw std::runtime_error(
                    std::string("Max retries exceeded.  Last error: ") +
                    e.what());
            }

            std::this_thread::sleep_for(computeBackoffMs(attempt));
            continue;
        }

        ++mTotalRequests;

        if (isRetryableStatus(resp.httpStatus)) {
            if (lastAttempt) {
                throw ApiError(resp.httpStatus, resp.body.dump());
            }

            ++mTotalRetries;
            auto backoff = computeBackoffMs(attempt);

            if (mVerbose) {
                std::cerr << "[Retry] HTTP " << resp.httpStatus
                          << " (attempt " << (attempt + 1) << "/"
                          << kMaxAttempts << "), backoff "
                          << backoff.count() << " ms\n";
            }

            std::this_thread::sleep_for(backoff);
            continue;
        }

        if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
            if (mVerbose) {
                std::cerr << "[HttpTransport] GET " << target << " failed with HTTP "
                          << resp.httpStatus << "\n";
            }
            throw ApiError(resp.httpStatus, resp.body.dump());
        }

        return resp.body;
    }

    throw std::runtime_error("Max retries exceeded (unreachable)");
}

bool HttpTransport::isRetryableStatus(unsigned int status)
{
    return status == 429 || status >= 500;
}

} // namespace osu_rankings
