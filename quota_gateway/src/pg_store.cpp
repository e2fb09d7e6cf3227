#include "pg_store.hpp"
#include <spdlog/spdlog.h>
#include <map>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() const {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS usage_ledger (
                id BIGSERIAL PRIMARY KEY,
                tenant_id TEXT NOT NULL,
                budget_kind TEXT NOT NULL,
                amount BIGINT NOT NULL CHECK (amount >= 0),
                operation TEXT NOT NULL DEFAULT '',
                recorded_at TIMESTAMPTZ NOT NULL
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_usage_ledger_tenant_kind_ts
                ON usage_ledger (tenant_id, budget_kind, recorded_at)
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}

void PostgresStore::append(const UsageRecord& record) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO usage_ledger (tenant_id, budget_kind, amount, operation, recorded_at) "
            "VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000.0))",
            record.tenant_id, record.budget_kind, record.amount, record.operation,
            record.timestamp_ms
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to append usage record: {}", e.what());
        throw;
    }
}

int64_t PostgresStore::sum_since(const std::string& tenant_id,
                                 const std::string& budget_kind,
                                 int64_t since_ms) const {
    try {
        auto conn = make_connection();
        pqxx::read_transaction txn(conn);

        auto result = txn.exec_params(
            "SELECT COALESCE(SUM(amount), 0) FROM usage_ledger "
            "WHERE tenant_id = $1 AND budget_kind = $2 "
            "AND recorded_at >= to_timestamp($3::double precision / 1000.0)",
            tenant_id, budget_kind, since_ms
        );

        return result[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to sum usage for tenant {}: {}", tenant_id, e.what());
        throw;
    }
}

namespace {

const std::map<std::string, std::string>& count_queries() {
    static const std::map<std::string, std::string> queries = {
        {"client-space",
         "SELECT COUNT(*) FROM clients WHERE tenant_id = $1 AND is_active = TRUE"},
        {"external-user",
         "SELECT COUNT(*) FROM external_users WHERE tenant_id = $1 AND status <> 'Removed'"},
        {"library",
         "SELECT COUNT(*) FROM client_libraries WHERE tenant_id = $1"},
        {"admin",
         "SELECT COUNT(*) FROM tenant_users WHERE tenant_id = $1 AND role IN ('Owner', 'Admin')"}
    };
    return queries;
}

} // namespace

std::vector<std::string> PostgresStore::countable_resource_kinds() {
    std::vector<std::string> kinds;
    for (const auto& [kind, _] : count_queries()) {
        kinds.push_back(kind);
    }
    return kinds;
}

std::string PostgresStore::count_query(const std::string& resource_kind) {
    auto it = count_queries().find(resource_kind);
    if (it == count_queries().end()) {
        throw ConfigError("No resource count defined for kind '" + resource_kind + "'");
    }
    return it->second;
}

int64_t PostgresStore::count_resources(const std::string& tenant_id,
                                       const std::string& resource_kind) const {
    const std::string query = count_query(resource_kind);

    try {
        auto conn = make_connection();
        pqxx::read_transaction txn(conn);
        auto result = txn.exec_params(query, tenant_id);
        return result[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to count {} for tenant {}: {}", resource_kind, tenant_id, e.what());
        throw;
    }
}

std::vector<std::string> PostgresStore::active_plan_tiers() const {
    std::vector<std::string> tiers;

    try {
        auto conn = make_connection();
        pqxx::read_transaction txn(conn);
        auto result = txn.exec(
            "SELECT DISTINCT tier FROM subscriptions WHERE status IN ('Active', 'Trial')");

        for (const auto& row : result) {
            tiers.push_back(row[0].as<std::string>());
        }

    } catch (const std::exception& e) {
        spdlog::error("Failed to read active plan tiers: {}", e.what());
        throw;
    }

    return tiers;
}
