#ifndef LUDOTECA_CANCELLATION_SIGNAL_HPP
#define LUDOTECA_CANCELLATION_SIGNAL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace ludoteca {

/**
 * One-shot cancellation signal shared between the code that owns the
 * application lifetime and the components that must shut down with it.
 *
 * Once cancel() is called the signal stays cancelled. Callbacks registered
 * with onCancel() run exactly once, on the thread calling cancel() (or
 * immediately on the registering thread if the signal already fired).
 * Callbacks must return quickly and must not call back into the signal.
 */
class CancellationSignal {
public:
    using Callback = std::function<void()>;
    using CallbackId = std::size_t;

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    void cancel();
    bool isCancelled() const;

    // Blocks until cancelled.
    void wait() const;

    // Returns true if the signal fired before the timeout.
    bool waitFor(std::chrono::milliseconds timeout) const;

    CallbackId onCancel(Callback callback);
    void removeCallback(CallbackId id);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    CallbackId next_id_ = 1;
    std::map<CallbackId, Callback> callbacks_;
};

} // namespace ludoteca

#endif // LUDOTECA_CANCELLATION_SIGNAL_HPP
