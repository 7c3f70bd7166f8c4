#include "utils/cancellation_signal.hpp"

namespace ludoteca {

void CancellationSignal::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) return;
    cancelled_ = true;

    // Invoked under the lock so removeCallback() cannot return while a
    // callback is still running.
    for (auto& entry : callbacks_) {
        if (entry.second) entry.second();
    }
    callbacks_.clear();
    cv_.notify_all();
}

bool CancellationSignal::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationSignal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return cancelled_; });
}

bool CancellationSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

CancellationSignal::CallbackId CancellationSignal::onCancel(Callback callback) {
    std::unique_lock<std::mutex> lock(mutex_);
    const CallbackId id = next_id_++;
    if (cancelled_) {
        lock.unlock();
        if (callback) callback();
        return id;
    }
    callbacks_[id] = std::move(callback);
    return id;
}

void CancellationSignal::removeCallback(CallbackId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

} // namespace ludoteca
