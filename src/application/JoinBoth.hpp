/**
 * @file JoinBoth.hpp
 * @brief Runs two cancellable fetches concurrently and joins them before returning.
 */

#pragma once

#include <future>
#include <mutex>
#include <optional>
#include <utility>

#include "domain/DomainErrors.hpp"
#include "domain/common/CancellationToken.hpp"
#include "domain/common/Result.hpp"

namespace glucosetrail::application {

/**
 * @brief Structured join of two fetches.
 *
 * Each fetch receives a token linked to @p token. The first failure is kept and the
 * sibling is signalled to cancel; both futures are always waited on, so no work outlives
 * the call. If the caller cancels, the outcome is Request.Cancelled whatever the fetches
 * returned. Fetches must report failures through Result, not by throwing.
 *
 * @tparam A value type of the first fetch.
 * @tparam B value type of the second fetch.
 */
template <typename A, typename B, typename FetchA, typename FetchB>
domain::Result<std::pair<A, B>> JoinBoth(const domain::CancellationToken& token, FetchA fetchA, FetchB fetchB) {
    if (token.isCancellationRequested()) {
        return domain::errors::RequestCancelled();
    }

    domain::CancellationSource linked(token);
    std::mutex errorMutex;
    std::optional<domain::Error> firstError;

    auto run = [&](auto& fetch) {
        auto result = fetch(linked.token());
        if (result.isFailure()) {
            {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!firstError) firstError = result.error();
            }
            linked.cancel();
        }
        return result;
    };

    auto futureA = std::async(std::launch::async, [&] { return run(fetchA); });
    auto futureB = std::async(std::launch::async, [&] { return run(fetchB); });
    futureA.wait();
    futureB.wait();

    domain::Result<A> a = futureA.get();
    domain::Result<B> b = futureB.get();

    if (token.isCancellationRequested()) {
        return domain::errors::RequestCancelled();
    }
    if (firstError) {
        return *firstError;
    }
    return std::make_pair(std::move(a).value(), std::move(b).value());
}

} // namespace glucosetrail::application
