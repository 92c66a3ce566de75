#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace osu_rankings {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path component (e.g. "/api/v2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Percent-encode a query value per RFC 3986 (unreserved characters kept).
std::string urlEncode(const std::string& value);

/// Build "path?key=value&..." with encoded values. Keys are emitted as is,
/// so callers encode any untrusted part of a key themselves.
std::string buildTarget(const std::string& path,
                        const std::vector<std::pair<std::string, std::string>>& query);

} // namespace osu_rankings
