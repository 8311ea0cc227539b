// Cooperative cancellation signal with an optional deadline. Copies share
// the same state, so a caller can keep one copy and cancel from any thread
// while a transfer waits on another.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace scpbridge {

class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    // Never expires unless cancelled.
    CancelToken();

    static CancelToken withDeadline(Clock::time_point deadline);
    static CancelToken withTimeout(std::chrono::milliseconds timeout);

    void cancel();
    bool isCancelled() const;
    std::optional<Clock::time_point> deadline() const;

    // Runs cb once when the token is cancelled; right away if it already is.
    // The callback runs on the cancelling thread and must not block.
    std::uint64_t subscribe(std::function<void()> cb) const;
    void unsubscribe(std::uint64_t id) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace scpbridge
