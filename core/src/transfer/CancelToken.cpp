#include "scpbridge/CancelToken.hpp"

#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scpbridge {

struct CancelToken::State {
    mutable std::mutex mtx;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
    std::uint64_t nextId = 1;
    std::unordered_map<std::uint64_t, std::function<void()>> listeners;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::withDeadline(Clock::time_point deadline) {
    CancelToken t;
    t.state_->deadline = deadline;
    return t;
}

CancelToken CancelToken::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

void CancelToken::cancel() {
    std::vector<std::function<void()>> toRun;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        toRun.reserve(state_->listeners.size());
        for (auto &kv : state_->listeners)
            toRun.push_back(std::move(kv.second));
        state_->listeners.clear();
    }
    for (auto &cb : toRun)
        cb();
}

bool CancelToken::isCancelled() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->cancelled;
}

std::optional<CancelToken::Clock::time_point> CancelToken::deadline() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->deadline;
}

std::uint64_t CancelToken::subscribe(std::function<void()> cb) const {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->cancelled) {
            const std::uint64_t id = state_->nextId++;
            state_->listeners.emplace(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void CancelToken::unsubscribe(std::uint64_t id) const {
    if (id == 0)
        return;
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->listeners.erase(id);
}

} // namespace scpbridge
