#pragma once

#include "json_types.hpp"
#include "request.hpp"

#include <future>

namespace osu_rankings {

/// A result that becomes available once the future is waited on. Pending
/// operations handed out by this library are deferred: nothing is sent
/// before get() or wait() is called, so dropping the future cancels the
/// request.
template <typename T>
using Pending = std::future<T>;

/// Moves logical requests to the API and back.
class Transport {
public:
    virtual ~Transport() = default;

    /// Submit one request. The future yields the response body or rethrows
    /// the transport failure.
    virtual Pending<Json> submit(const Request& request) = 0;
};

} // namespace osu_rankings
