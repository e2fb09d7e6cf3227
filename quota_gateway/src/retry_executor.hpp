#pragma once

#include "error_classifier.hpp"
#include "cancellation.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    // Delay after failed attempt n (1-based): base * 2^n, capped.
    std::chrono::milliseconds delay_for(int attempt) const;
};

// Last observed failure of a RunWithRetry call. Attempt history is only
// in the logs.
struct RetryFailure {
    ErrorKind last_error_kind = ErrorKind::Unknown;
    int attempts = 0;
    int status_code = 0;
    std::string sub_code;
    TransportFailure transport = TransportFailure::None;
    std::string message;
    bool cancelled = false;
};

template <typename T>
struct RetryOutcome {
    std::optional<T> value;
    RetryFailure failure;
    int attempts = 0;

    bool ok() const { return value.has_value(); }
};

class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy = RetryPolicy{},
                           std::shared_ptr<Sleeper> sleeper = nullptr);

    const RetryPolicy& policy() const { return policy_; }

    // Runs fn until it succeeds, fails with a non-transient error, exhausts
    // max_retries, or the token is cancelled during a backoff wait.
    template <typename Fn>
    RetryOutcome<std::invoke_result_t<Fn&>>
    run_with_retry(const std::string& operation_name, Fn&& fn,
                   const CancellationToken* token = nullptr);

private:
    struct Step {
        bool retry = false;
        std::chrono::milliseconds delay{0};
    };

    RetryPolicy policy_;
    std::shared_ptr<Sleeper> sleeper_;

    RetryFailure capture(const std::string& operation_name, int attempt,
                         const std::exception& error) const;
    Step decide(ErrorKind kind, int attempt) const;

    void log_success(const std::string& operation_name, int attempt) const;
    void log_retry(const std::string& operation_name, const RetryFailure& failure,
                   std::chrono::milliseconds delay) const;
    void log_final(const std::string& operation_name, const RetryFailure& failure) const;
};

template <typename Fn>
RetryOutcome<std::invoke_result_t<Fn&>>
RetryExecutor::run_with_retry(const std::string& operation_name, Fn&& fn,
                              const CancellationToken* token) {
    RetryOutcome<std::invoke_result_t<Fn&>> outcome;

    for (int attempt = 1;; ++attempt) {
        outcome.attempts = attempt;

        try {
            outcome.value.emplace(fn());
            log_success(operation_name, attempt);
            return outcome;
        } catch (const std::exception& e) {
            outcome.failure = capture(operation_name, attempt, e);
        }

        Step step = decide(outcome.failure.last_error_kind, attempt);
        if (!step.retry) {
            log_final(operation_name, outcome.failure);
            return outcome;
        }

        log_retry(operation_name, outcome.failure, step.delay);
        if (!sleeper_->sleep_for(step.delay, token)) {
            outcome.failure.cancelled = true;
            log_final(operation_name, outcome.failure);
            return outcome;
        }
    }
}
