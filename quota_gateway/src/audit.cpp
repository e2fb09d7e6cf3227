#include "audit.hpp"
#include "util.hpp"

nlohmann::json Auditor::build_denial_event(const std::string& tenant_id,
                                           const QuotaDecision& decision) {
    nlohmann::json event = {
        {"event", "quota_denied"},
        {"tenant_id", tenant_id},
        {"reason", to_string(decision.reason)},
        {"plan_tier", decision.plan_tier},
        {"ts", util::current_iso8601()}
    };

    if (decision.retry_after) {
        event["retry_after_ms"] = decision.retry_after->count();
    }
    if (!decision.budget_kind.empty()) {
        event["budget_kind"] = decision.budget_kind;
    }
    if (!decision.resource_kind.empty()) {
        event["resource_kind"] = decision.resource_kind;
    }
    if (decision.reason == DenialReason::UsageBudgetExceeded ||
        decision.reason == DenialReason::StaticLimitExceeded) {
        event["current"] = decision.current;
        event["limit"] = decision.limit;
    }

    return event;
}

RedisAuditSink::RedisAuditSink(std::shared_ptr<RedisBus> redis, std::string stream)
    : redis_(std::move(redis))
    , stream_(std::move(stream))
{}

void RedisAuditSink::emit_denial(const std::string& tenant_id, const QuotaDecision& decision) {
    redis_->publish_audit(stream_, Auditor::build_denial_event(tenant_id, decision));
}
