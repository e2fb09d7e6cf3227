#pragma once

#include "plan_limits.hpp"
#include <chrono>
#include <optional>
#include <string>

enum class DenialReason {
    Ok,
    RateLimited,
    UsageBudgetExceeded,
    StaticLimitExceeded
};

inline std::string to_string(DenialReason reason) {
    switch (reason) {
        case DenialReason::RateLimited: return "RateLimited";
        case DenialReason::UsageBudgetExceeded: return "UsageBudgetExceeded";
        case DenialReason::StaticLimitExceeded: return "StaticLimitExceeded";
        default: return "Ok";
    }
}

struct QuotaRequest {
    std::string tenant_id;
    std::string plan_tier;
    std::string budget_kind;    // empty: no monthly budget applies
    std::string resource_kind;  // empty: the operation creates no resource
};

struct QuotaDecision {
    bool allowed = false;
    DenialReason reason = DenialReason::Ok;
    std::optional<std::chrono::milliseconds> retry_after;

    // Populated for budget and static-limit denials.
    int64_t current = 0;
    int64_t limit = kUnlimited;

    std::string plan_tier;
    std::string budget_kind;
    std::string resource_kind;
};
