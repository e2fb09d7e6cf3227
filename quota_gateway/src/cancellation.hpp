#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Caller-owned cancellation flag. A caller with an overall deadline cancels
// it; waits in progress wake immediately.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Returns false if the token was cancelled before the duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Suspends a retrying request between attempts.
class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Returns false when the wait was aborted by cancellation.
    virtual bool sleep_for(std::chrono::milliseconds delay,
                           const CancellationToken* token) = 0;
};

// Waits on the token's condition variable (or a private one when no token
// is supplied). No locks besides the waiting request's own are held.
class CancellableSleeper : public Sleeper {
public:
    bool sleep_for(std::chrono::milliseconds delay,
                   const CancellationToken* token) override;
};
