#pragma once

#include "plan_limits.hpp"
#include "resource_store.hpp"
#include "usage_ledger.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

// usage_ledger is owned here. The entity tables (clients, external_users,
// client_libraries, tenant_users, subscriptions) belong to the main backend
// and are only read.
class PostgresStore : public UsageLedger, public ResourceCounter {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();
    bool ping();

    void append(const UsageRecord& record) override;
    int64_t sum_since(const std::string& tenant_id,
                      const std::string& budget_kind,
                      int64_t since_ms) const override;

    int64_t count_resources(const std::string& tenant_id,
                            const std::string& resource_kind) const override;

    // Distinct tiers of Active/Trial subscriptions.
    std::vector<std::string> active_plan_tiers() const;

    static std::vector<std::string> countable_resource_kinds();

private:
    std::string dsn_;
    pqxx::connection make_connection() const;

    static std::string count_query(const std::string& resource_kind);
};
