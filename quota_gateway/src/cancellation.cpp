#include "cancellation.hpp"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

bool CancellableSleeper::sleep_for(std::chrono::milliseconds delay,
                                   const CancellationToken* token) {
    if (token) {
        if (token->is_cancelled()) return false;
        return token->wait_for(delay);
    }

    CancellationToken local;
    return local.wait_for(delay);
}
