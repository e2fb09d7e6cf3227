#include "http_mapping.hpp"

HttpReply to_http_reply(const OperationError& error) {
    HttpReply reply;

    switch (error.kind) {
        case OperationErrorKind::RateLimited: {
            int64_t seconds = retry_after_seconds(error.retry_after);

            reply.status = 429;
            reply.headers["Retry-After"] = std::to_string(seconds);
            reply.body = {
                {"error", "RateLimitExceeded"},
                {"message", error.user_message()},
                {"retryAfterSeconds", seconds},
                {"limit", error.limit},
                {"planTier", error.plan_tier}
            };
            break;
        }

        case OperationErrorKind::UsageBudgetExceeded:
            reply.status = 429;
            reply.body = {
                {"error", "UsageBudgetExceeded"},
                {"message", error.user_message()},
                {"budgetKind", error.budget_kind},
                {"currentUsage", error.current},
                {"limit", error.limit},
                {"planTier", error.plan_tier}
            };
            break;

        case OperationErrorKind::StaticLimitExceeded:
            reply.status = 402;
            reply.body = {
                {"error", "QuotaExceeded"},
                {"message", error.user_message()},
                {"resourceKind", error.resource_kind},
                {"current", error.current},
                {"limit", error.limit},
                {"planTier", error.plan_tier}
            };
            break;

        case OperationErrorKind::UpstreamFailed:
            reply.status = 502;
            reply.body = {
                {"error", "OperationFailed"},
                {"message", error.user_message()},
                {"correlationId", error.correlation_id}
            };
            break;

        default:
            reply.status = 200;
            break;
    }

    return reply;
}

void add_rate_limit_headers(HttpReply& reply, const RateWindowStatus& status) {
    if (is_unlimited(status.limit)) return;

    reply.headers["X-RateLimit-Limit"] = std::to_string(status.limit);
    reply.headers["X-RateLimit-Remaining"] = std::to_string(status.remaining);
    reply.headers["X-RateLimit-Reset"] = std::to_string(status.reset_at_ms / 1000);
}
