#include "retry_executor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    int shift = std::clamp(attempt, 0, 30);
    auto delay = base_delay * (int64_t{1} << shift);
    return std::min<std::chrono::milliseconds>(delay, max_delay);
}

RetryExecutor::RetryExecutor(RetryPolicy policy, std::shared_ptr<Sleeper> sleeper)
    : policy_(policy)
    , sleeper_(sleeper ? std::move(sleeper) : std::make_shared<CancellableSleeper>())
{}

RetryFailure RetryExecutor::capture(const std::string& operation_name, int attempt,
                                    const std::exception& error) const {
    RetryFailure failure;
    failure.attempts = attempt;
    failure.last_error_kind = ErrorClassifier::classify_exception(error);

    if (auto upstream = dynamic_cast<const UpstreamError*>(&error)) {
        failure.status_code = upstream->status_code();
        failure.sub_code = upstream->sub_code();
        failure.transport = upstream->transport();
    }

    failure.message = fmt::format("{} failed after {} attempt(s): {}",
                                  operation_name, attempt, error.what());
    return failure;
}

RetryExecutor::Step RetryExecutor::decide(ErrorKind kind, int attempt) const {
    Step step;
    if (kind == ErrorKind::Transient && attempt <= policy_.max_retries) {
        step.retry = true;
        step.delay = policy_.delay_for(attempt);
    }
    return step;
}

void RetryExecutor::log_success(const std::string& operation_name, int attempt) const {
    if (attempt == 1) {
        spdlog::debug("Upstream operation '{}' succeeded", operation_name);
    } else {
        spdlog::info("Upstream operation '{}' succeeded after {} attempts",
                     operation_name, attempt);
    }
}

void RetryExecutor::log_retry(const std::string& operation_name, const RetryFailure& failure,
                              std::chrono::milliseconds delay) const {
    spdlog::warn("Upstream operation '{}' failed (attempt {}/{}, {} status={} code={} transport={}); "
                 "retrying in {}ms",
                 operation_name, failure.attempts, policy_.max_retries + 1,
                 to_string(failure.last_error_kind), failure.status_code,
                 failure.sub_code.empty() ? "-" : failure.sub_code,
                 to_string(failure.transport), delay.count());
}

void RetryExecutor::log_final(const std::string& operation_name, const RetryFailure& failure) const {
    if (failure.last_error_kind == ErrorKind::Unknown) {
        spdlog::error("Upstream operation '{}' failed with unrecognized error after {} attempt(s) "
                      "(status={} code={}); not retried",
                      operation_name, failure.attempts, failure.status_code,
                      failure.sub_code.empty() ? "-" : failure.sub_code);
        return;
    }

    spdlog::warn("Upstream operation '{}' gave up after {} attempt(s): {} status={} code={}{}",
                 operation_name, failure.attempts, to_string(failure.last_error_kind),
                 failure.status_code, failure.sub_code.empty() ? "-" : failure.sub_code,
                 failure.cancelled ? " (cancelled)" : "");
}
