#include "core/scheduler/CancellationToken.hpp"
#include <vector>

namespace infercache {
namespace core {
namespace scheduler {

void CancellationToken::Registration::reset() {
    if (!state_) return;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id_);
    if (state_->invoking && state_->invoker != std::this_thread::get_id()) {
        state_->condition.wait(lock, [this] { return !state_->invoking; });
    }
    lock.unlock();
    state_.reset();
}

bool CancellationToken::isCancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->condition.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

CancellationToken::Registration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_ || !callback) return Registration();
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return Registration();
    }
    uint64_t id = state_->nextId++;
    state_->callbacks.emplace(id, std::move(callback));
    return Registration(state_, id);
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        state_->invoking = true;
        state_->invoker = std::this_thread::get_id();
        for (auto& item : state_->callbacks) {
            callbacks.push_back(std::move(item.second));
        }
        state_->callbacks.clear();
    }
    state_->condition.notify_all();

    for (auto& callback : callbacks) {
        callback();
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->invoking = false;
    }
    state_->condition.notify_all();
}

bool CancellationSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace scheduler
} // namespace core
} // namespace infercache
