#pragma once

#include "clock.hpp"
#include "plan_limits.hpp"
#include "usage_ledger.hpp"
#include <memory>
#include <string>

struct UsageDecision {
    bool allowed = false;
    int64_t current = 0;
    int64_t limit = kUnlimited;
};

struct UsageSnapshot {
    std::string budget_kind;
    int64_t current = 0;
    int64_t limit = kUnlimited;
    double percent_used = 0.0;
    int64_t month_start_ms = 0;
};

// Monthly budget per (tenant, budget kind). The month's usage is the sum of
// ledger records since the UTC month start; nothing is ever reset.
class UsageBudgetTracker {
public:
    UsageBudgetTracker(std::shared_ptr<UsageLedger> ledger,
                       std::shared_ptr<const Clock> clock);

    UsageDecision try_reserve(const std::string& tenant_id,
                              const std::string& budget_kind,
                              int64_t limit) const;

    // Only after the protected operation succeeded.
    void commit(const std::string& tenant_id, const std::string& budget_kind,
                int64_t amount, const std::string& operation = "");

    UsageSnapshot snapshot(const std::string& tenant_id,
                           const std::string& budget_kind,
                           int64_t limit) const;

private:
    std::shared_ptr<UsageLedger> ledger_;
    std::shared_ptr<const Clock> clock_;

    int64_t usage_this_month(const std::string& tenant_id,
                             const std::string& budget_kind,
                             int64_t month_start_ms) const;
};
