#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

struct UsageRecord {
    std::string tenant_id;
    std::string budget_kind;
    int64_t amount = 0;
    std::string operation;
    int64_t timestamp_ms = 0;
};

// Append-only record of committed usage. Running totals are always derived
// from it, never stored.
class UsageLedger {
public:
    virtual ~UsageLedger() = default;

    virtual void append(const UsageRecord& record) = 0;
    virtual int64_t sum_since(const std::string& tenant_id,
                              const std::string& budget_kind,
                              int64_t since_ms) const = 0;
};

class InMemoryUsageLedger : public UsageLedger {
public:
    void append(const UsageRecord& record) override;
    int64_t sum_since(const std::string& tenant_id,
                      const std::string& budget_kind,
                      int64_t since_ms) const override;

    std::vector<UsageRecord> records() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<UsageRecord> records_;
};
