#include "usage_budget.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

UsageBudgetTracker::UsageBudgetTracker(std::shared_ptr<UsageLedger> ledger,
                                       std::shared_ptr<const Clock> clock)
    : ledger_(std::move(ledger))
    , clock_(std::move(clock))
{}

int64_t UsageBudgetTracker::usage_this_month(const std::string& tenant_id,
                                             const std::string& budget_kind,
                                             int64_t month_start_ms) const {
    return ledger_->sum_since(tenant_id, budget_kind, month_start_ms);
}

UsageDecision UsageBudgetTracker::try_reserve(const std::string& tenant_id,
                                              const std::string& budget_kind,
                                              int64_t limit) const {
    UsageDecision decision;
    decision.limit = limit;

    if (is_unlimited(limit)) {
        decision.allowed = true;
        return decision;
    }

    int64_t month_start = util::utc_month_start_ms(clock_->now_ms());
    decision.current = usage_this_month(tenant_id, budget_kind, month_start);
    decision.allowed = decision.current < limit;
    return decision;
}

void UsageBudgetTracker::commit(const std::string& tenant_id, const std::string& budget_kind,
                                int64_t amount, const std::string& operation) {
    if (amount < 0) {
        throw std::invalid_argument("Usage amount must not be negative");
    }

    UsageRecord record;
    record.tenant_id = tenant_id;
    record.budget_kind = budget_kind;
    record.amount = amount;
    record.operation = operation;
    record.timestamp_ms = clock_->now_ms();

    ledger_->append(record);
    spdlog::debug("Committed {} {} for tenant {}", amount, budget_kind, tenant_id);
}

UsageSnapshot UsageBudgetTracker::snapshot(const std::string& tenant_id,
                                           const std::string& budget_kind,
                                           int64_t limit) const {
    UsageSnapshot snap;
    snap.budget_kind = budget_kind;
    snap.limit = limit;
    snap.month_start_ms = util::utc_month_start_ms(clock_->now_ms());
    snap.current = usage_this_month(tenant_id, budget_kind, snap.month_start_ms);

    if (!is_unlimited(limit) && limit > 0) {
        snap.percent_used = static_cast<double>(snap.current) * 100.0 / static_cast<double>(limit);
    }
    return snap;
}
