#include "operation_error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

std::string to_string(OperationErrorKind kind) {
    switch (kind) {
        case OperationErrorKind::RateLimited: return "RateLimited";
        case OperationErrorKind::UsageBudgetExceeded: return "UsageBudgetExceeded";
        case OperationErrorKind::StaticLimitExceeded: return "StaticLimitExceeded";
        case OperationErrorKind::UpstreamFailed: return "UpstreamFailed";
        default: return "None";
    }
}

std::string describe_kind(const std::string& kind) {
    static const std::map<std::string, std::string> names = {
        {"ai-message", "messages"},
        {"api-call", "API calls"},
        {"token", "tokens"},
        {"client-space", "client spaces"},
        {"external-user", "external users"},
        {"library", "libraries"},
        {"admin", "administrators"}
    };

    auto it = names.find(kind);
    return it == names.end() ? kind : it->second;
}

int64_t retry_after_seconds(const std::optional<std::chrono::milliseconds>& retry_after) {
    int64_t ms = retry_after ? retry_after->count() : 0;
    return std::max<int64_t>(1, (ms + 999) / 1000);
}

bool OperationError::is_denial() const {
    return kind == OperationErrorKind::RateLimited ||
           kind == OperationErrorKind::UsageBudgetExceeded ||
           kind == OperationErrorKind::StaticLimitExceeded;
}

OperationError OperationError::from_denial(const QuotaDecision& decision) {
    OperationError err;
    switch (decision.reason) {
        case DenialReason::RateLimited:
            err.kind = OperationErrorKind::RateLimited;
            break;
        case DenialReason::UsageBudgetExceeded:
            err.kind = OperationErrorKind::UsageBudgetExceeded;
            break;
        case DenialReason::StaticLimitExceeded:
            err.kind = OperationErrorKind::StaticLimitExceeded;
            break;
        default:
            err.kind = OperationErrorKind::None;
            break;
    }

    err.retry_after = decision.retry_after;
    err.current = decision.current;
    err.limit = decision.limit;
    err.plan_tier = decision.plan_tier;
    err.budget_kind = decision.budget_kind;
    err.resource_kind = decision.resource_kind;
    return err;
}

OperationError OperationError::from_retry_failure(const RetryFailure& failure,
                                                  const std::string& correlation_id) {
    OperationError err;
    err.kind = OperationErrorKind::UpstreamFailed;
    err.last_error_kind = failure.last_error_kind;
    err.attempts = failure.attempts;
    err.cancelled = failure.cancelled;
    err.upstream_status = failure.status_code;
    err.upstream_code = failure.sub_code;
    err.correlation_id = correlation_id;
    return err;
}

std::string OperationError::user_message() const {
    switch (kind) {
        case OperationErrorKind::RateLimited: {
            int64_t seconds = retry_after_seconds(retry_after);
            return fmt::format("Rate limit of {} requests exceeded. Please try again in {} {}.",
                               limit, seconds, seconds == 1 ? "second" : "seconds");
        }
        case OperationErrorKind::UsageBudgetExceeded:
            return fmt::format("Monthly limit of {} {} exceeded for {} plan. Upgrade to continue.",
                               limit, describe_kind(budget_kind), plan_tier);
        case OperationErrorKind::StaticLimitExceeded:
            return fmt::format("You have reached the maximum number of {} ({}) for your {} plan. "
                               "Upgrade your subscription to add more.",
                               describe_kind(resource_kind), limit, plan_tier);
        case OperationErrorKind::UpstreamFailed:
            return "The operation could not be completed right now. Please retry later.";
        default:
            return "";
    }
}
