/**
 * @file StoreCall.hpp
 * @brief Adapts a throwing event-store call to a Result.
 */

#pragma once

#include <exception>
#include <iostream>
#include <type_traits>

#include "domain/DomainErrors.hpp"
#include "domain/common/CancellationToken.hpp"
#include "domain/common/Result.hpp"

namespace glucosetrail::application {

/**
 * @brief Invokes @p call unless @p token is cancelled, mapping exceptions to EventStore.Error.
 */
template <typename F>
auto CallStore(const domain::CancellationToken& token, F&& call) -> domain::Result<std::invoke_result_t<F>> {
    if (token.isCancellationRequested()) {
        return domain::errors::RequestCancelled();
    }
    try {
        return call();
    } catch (const std::exception& e) {
        std::cerr << "[EventStore] " << e.what() << std::endl;
        return domain::errors::EventStoreFailure(e.what());
    }
}

} // namespace glucosetrail::application
