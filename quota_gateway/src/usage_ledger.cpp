#include "usage_ledger.hpp"
#include <mutex>

void InMemoryUsageLedger::append(const UsageRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.push_back(record);
}

int64_t InMemoryUsageLedger::sum_since(const std::string& tenant_id,
                                       const std::string& budget_kind,
                                       int64_t since_ms) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    int64_t total = 0;
    for (const auto& rec : records_) {
        if (rec.tenant_id == tenant_id && rec.budget_kind == budget_kind &&
            rec.timestamp_ms >= since_ms) {
            total += rec.amount;
        }
    }
    return total;
}

std::vector<UsageRecord> InMemoryUsageLedger::records() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_;
}
