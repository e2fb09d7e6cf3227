#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr int64_t kUnlimited = -1;

inline bool is_unlimited(int64_t limit) { return limit < 0; }

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct RateLimit {
    int64_t max_requests = kUnlimited;
    std::chrono::milliseconds window{60000};
};

// Immutable once built; a tier change means resolving a different entry.
struct PlanLimits {
    std::string tier;
    RateLimit rate;
    std::map<std::string, int64_t> monthly_budgets;
    std::map<std::string, int64_t> static_resource_limits;

    // Kinds missing from the maps are unlimited.
    int64_t monthly_budget(const std::string& budget_kind) const;
    int64_t resource_limit(const std::string& resource_kind) const;
};

class PlanLimitResolver {
public:
    explicit PlanLimitResolver(std::vector<PlanLimits> plans);

    // Starter / Professional / Business / Enterprise catalog.
    static PlanLimitResolver builtin();
    static PlanLimitResolver from_json(const nlohmann::json& doc);
    static PlanLimitResolver from_file(const std::string& path);

    // Case-insensitive. Throws ConfigError for an unknown tier.
    std::shared_ptr<const PlanLimits> resolve(const std::string& tier) const;
    bool has_tier(const std::string& tier) const;

    // Throws ConfigError naming every required tier without limits.
    void validate(const std::vector<std::string>& required_tiers) const;

    // Throws ConfigError naming every static resource limit (tier.kind) the
    // resource store cannot count.
    void validate_resource_kinds(const std::vector<std::string>& countable_kinds) const;

private:
    std::map<std::string, std::shared_ptr<const PlanLimits>> plans_;
};
