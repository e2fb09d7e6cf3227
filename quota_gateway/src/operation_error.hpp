#pragma once

#include "error_classifier.hpp"
#include "quota_decision.hpp"
#include "retry_executor.hpp"
#include <chrono>
#include <optional>
#include <string>

enum class OperationErrorKind {
    None,
    RateLimited,
    UsageBudgetExceeded,
    StaticLimitExceeded,
    UpstreamFailed
};

std::string to_string(OperationErrorKind kind);

struct OperationError {
    OperationErrorKind kind = OperationErrorKind::None;

    // RateLimited
    std::optional<std::chrono::milliseconds> retry_after;

    // UsageBudgetExceeded / StaticLimitExceeded
    int64_t current = 0;
    int64_t limit = kUnlimited;
    std::string plan_tier;
    std::string budget_kind;
    std::string resource_kind;

    // UpstreamFailed. Status and code stay in logs, never in user text.
    ErrorKind last_error_kind = ErrorKind::Unknown;
    int attempts = 0;
    bool cancelled = false;
    int upstream_status = 0;
    std::string upstream_code;
    std::string correlation_id;

    bool is_denial() const;

    static OperationError from_denial(const QuotaDecision& decision);
    static OperationError from_retry_failure(const RetryFailure& failure,
                                             const std::string& correlation_id);

    // Client-facing text, e.g. "Monthly limit of 20 messages exceeded for
    // Starter plan. Upgrade to continue."
    std::string user_message() const;
};

// Whole seconds to wait, rounded up, at least 1.
int64_t retry_after_seconds(const std::optional<std::chrono::milliseconds>& retry_after);

// Human unit for a budget or resource kind ("ai-message" -> "messages").
std::string describe_kind(const std::string& kind);
