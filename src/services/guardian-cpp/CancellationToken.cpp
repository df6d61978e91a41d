#include "CancellationToken.hpp"

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout.count() <= 0) {
        return cancelled_;
    }
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}
