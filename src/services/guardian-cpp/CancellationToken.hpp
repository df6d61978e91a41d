#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Shutdown request observed by the control loop at tick boundaries.
class CancellationToken {
public:
    void Cancel();
    bool IsCancelled() const;

    // Sleeps up to timeout; returns true as soon as cancellation is requested.
    bool WaitFor(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};
