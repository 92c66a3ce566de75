#pragma once

#include "json_types.hpp"

#include <string>

namespace osu_rankings {

/// Low-level HTTP client built on Boost.Beast.
/// Sends a GET below the API base URL and returns the parsed JSON body.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        Json         body;
    };

    /// @param baseUrl      API root, e.g. "https://osu.ppy.sh/api/v2"
    /// @param accessToken  Optional OAuth token (sent as a Bearer token)
    /// @param timeoutMs    Per-operation timeout in milliseconds
    HttpClient(const std::string& baseUrl,
               const std::string& accessToken = "",
               int timeoutMs = 5000);

    /// GET @p target (path plus query, relative to the base URL).
    /// Error statuses are returned, not thrown; a non-JSON error body is
    /// kept as a JSON string.
    /// @throws std::runtime_error on network / timeout / parse errors.
    Response get(const std::string& target) const;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mAccessToken;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target) const;
    Response doHttpsRequest(const std::string& target) const;
    Response toResponse(unsigned int status, const std::string& rawBody) const;
};

} // namespace osu_rankings
