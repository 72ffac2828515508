/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared between a request and its sub-fetches.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

namespace glucosetrail::domain {

/**
 * @class CancellationToken
 * @brief Read-only view of one or more cancellation flags.
 *
 * A default-constructed token is never cancelled. A token obtained from a linked
 * CancellationSource observes the parent's flags as well as its own.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return std::any_of(m_flags.begin(), m_flags.end(),
            [](const auto& flag) { return flag->load(); });
    }

private:
    friend class CancellationSource;
    std::vector<std::shared_ptr<std::atomic<bool>>> m_flags;
};

/**
 * @class CancellationSource
 * @brief Owner side of a cancellation flag.
 */
class CancellationSource {
public:
    CancellationSource()
        : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    /// Creates a source that also reports cancellation when @p parent is cancelled.
    explicit CancellationSource(const CancellationToken& parent)
        : m_parentFlags(parent.m_flags), m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }

    bool isCancellationRequested() const { return token().isCancellationRequested(); }

    CancellationToken token() const {
        CancellationToken t;
        t.m_flags = m_parentFlags;
        t.m_flags.push_back(m_flag);
        return t;
    }

private:
    std::vector<std::shared_ptr<std::atomic<bool>>> m_parentFlags;
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace glucosetrail::domain
