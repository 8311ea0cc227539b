// Dual-unit supervision: each unit reports into its own completion slot, the
// waiter wakes on unit completion, token cancellation or deadline.
#include "scpbridge/TransferHarness.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <utility>

namespace scpbridge {

struct TransferHarness::Shared {
    struct Slot {
        bool done = false;
        TransferError err;
    };

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<Slot> slots; // one per unit, in spawn order
    std::size_t pending = 0;
    bool cancelled = false;
};

TransferHarness::TransferHarness() : shared_(std::make_shared<Shared>()) {}

TransferHarness::~TransferHarness() {
    // Units abandoned by a cancelled wait() own their state through Shared and
    // finish on their own.
    for (auto &t : threads_) {
        if (!t.joinable())
            continue;
        if (abandoned_)
            t.detach();
        else
            t.join();
    }
}

void TransferHarness::spawn(Unit unit) {
    std::size_t idx = 0;
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        idx = shared_->slots.size();
        shared_->slots.emplace_back();
        ++shared_->pending;
    }
    auto shared = shared_;
    threads_.emplace_back([shared, idx, unit = std::move(unit)]() {
        TransferError e;
        bool ok = false;
        try {
            ok = unit(e);
        } catch (const std::exception &ex) {
            e.set(ErrorKind::Transport, ex.what());
            ok = false;
        }
        if (!ok && !e.isSet())
            e.set(ErrorKind::Transport, "transfer unit failed");
        {
            std::lock_guard<std::mutex> lk(shared->mtx);
            auto &slot = shared->slots[idx];
            slot.done = true;
            if (!ok)
                slot.err = std::move(e);
            --shared->pending;
        }
        shared->cv.notify_all();
    });
}

bool TransferHarness::wait(const CancelToken &token,
                           std::chrono::milliseconds timeout,
                           TransferError &err) {
    std::optional<CancelToken::Clock::time_point> deadline = token.deadline();
    if (timeout.count() > 0) {
        const auto local = CancelToken::Clock::now() + timeout;
        if (!deadline || local < *deadline)
            deadline = local;
    }

    auto shared = shared_;
    const std::uint64_t subId = token.subscribe([shared]() {
        {
            std::lock_guard<std::mutex> lk(shared->mtx);
            shared->cancelled = true;
        }
        shared->cv.notify_all();
    });

    bool expired = false;
    bool cancelled = false;
    std::vector<TransferError> errors;
    {
        std::unique_lock<std::mutex> lk(shared_->mtx);
        auto finishedOrCancelled = [this]() {
            return shared_->pending == 0 || shared_->cancelled;
        };
        if (deadline) {
            expired = !shared_->cv.wait_until(lk, *deadline, finishedOrCancelled);
        } else {
            shared_->cv.wait(lk, finishedOrCancelled);
        }
        // Completion wins when it raced with a cancel.
        if (!expired && shared_->pending != 0)
            cancelled = true;
        if (!expired && !cancelled) {
            errors.reserve(shared_->slots.size());
            for (const auto &slot : shared_->slots) {
                if (slot.err.isSet())
                    errors.push_back(slot.err);
            }
        }
    }
    token.unsubscribe(subId);
    abandoned_ = expired || cancelled;

    if (expired) {
        err.set(ErrorKind::Cancellation, "transfer deadline exceeded");
        return false;
    }
    if (cancelled) {
        err.set(ErrorKind::Cancellation, "transfer canceled");
        return false;
    }
    if (!errors.empty()) {
        err = errors.front();
        return false;
    }
    return true;
}

} // namespace scpbridge
