/**
 * Cancellation.hpp - Cooperative cancellation for background work
 *
 * A CancellationSource owns the flag, tokens are cheap copies handed to every
 * operation spawned for a turn. A source created from a parent token is
 * cancelled together with its parent, so cancelling a turn also cancels each
 * prefetch it started.
 */

#pragma once

#include <chrono>
#include <memory>

namespace parley::core {

class CancellationSource;

class CancellationToken {
public:
    /** A default token is never cancelled. */
    CancellationToken() = default;

    bool isCancelled() const;

    /**
     * Sleep up to `duration`, waking early on cancellation.
     * @return false if the token was cancelled before the time elapsed
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

    struct State;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);
    ~CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel();
    bool isCancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace parley::core
