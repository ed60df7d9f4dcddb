#pragma once

/**
 * @file retry.h
 * @brief Single retry of transient engine failures
 */

#include "core/cancellation.h"
#include "errors.h"
#include "logger.h"
#include <chrono>
#include <string>
#include <utility>

namespace samaira {

/**
 * @brief Run `attempt`, retrying once after `backoff_ms` if it failed with EngineTransient
 *
 * The backoff wait ends early on cancellation, which yields Cancelled.
 * `can_retry` is consulted after the first failure; returning false
 * surfaces that failure unchanged (e.g. tokens were already emitted).
 *
 * @param attempt Callable returning Result<T>
 * @param can_retry Callable returning bool
 */
template<typename Attempt, typename CanRetry>
auto retry_transient(const std::string& what, int backoff_ms, const CancellationToken& cancel,
                     Attempt&& attempt, CanRetry&& can_retry) -> decltype(attempt()) {
    auto result = attempt();
    if (result.is_ok() || result.error().type != ErrorType::EngineTransient) {
        return result;
    }
    if (cancel.is_cancelled()) {
        return make_cancelled_error();
    }
    if (!can_retry()) {
        return result;
    }

    Logger::warn(what + " failed transiently (" + result.error().message +
                 "), retrying in " + std::to_string(backoff_ms) + "ms");
    if (!cancel.wait_for(std::chrono::milliseconds(backoff_ms))) {
        return make_cancelled_error();
    }
    return attempt();
}

template<typename Attempt>
auto retry_transient(const std::string& what, int backoff_ms, const CancellationToken& cancel,
                     Attempt&& attempt) -> decltype(attempt()) {
    return retry_transient(what, backoff_ms, cancel, std::forward<Attempt>(attempt),
                           [] { return true; });
}

} // namespace samaira
