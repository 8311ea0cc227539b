// Supervises the concurrent units of one transfer (protocol state machine and
// remote-process waiter) and races their completion against cancellation.
#pragma once
#include "CancelToken.hpp"
#include "ScpTypes.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace scpbridge {

class TransferHarness {
public:
    // A unit returns false and fills err when it fails.
    using Unit = std::function<bool(TransferError &err)>;

    TransferHarness();
    // Joins every unit, unless wait() returned a Cancellation error: the
    // units still running are then detached and never waited for. A unit
    // must own, or share ownership of, everything it touches.
    ~TransferHarness();

    TransferHarness(const TransferHarness &) = delete;
    TransferHarness &operator=(const TransferHarness &) = delete;

    // Starts a unit on its own thread. Call before wait().
    void spawn(Unit unit);

    // Blocks until every unit has finished, the token is cancelled, or the
    // earlier of the token deadline and now + timeout passes (timeout zero:
    // token deadline only). Cancellation returns right away with a
    // Cancellation error. Otherwise the first error in spawn order is
    // returned, or true when all units succeeded.
    bool wait(const CancelToken &token, std::chrono::milliseconds timeout,
              TransferError &err);

private:
    struct Shared;
    std::shared_ptr<Shared> shared_;
    std::vector<std::thread> threads_;
    bool abandoned_ = false;
};

} // namespace scpbridge
