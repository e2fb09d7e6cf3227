#include "plan_limits.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace {

int64_t parse_limit(const nlohmann::json& value, const std::string& what) {
    if (value.is_null()) return kUnlimited;
    if (!value.is_number_integer()) {
        throw ConfigError("Limit '" + what + "' must be an integer or null");
    }
    int64_t limit = value.get<int64_t>();
    if (limit == 0 || limit < kUnlimited) {
        throw ConfigError("Limit '" + what + "' must be positive or -1 for unlimited");
    }
    return limit;
}

std::map<std::string, int64_t> parse_limit_map(const nlohmann::json& obj,
                                               const std::string& tier,
                                               const std::string& section) {
    std::map<std::string, int64_t> out;
    if (obj.is_null()) return out;
    if (!obj.is_object()) {
        throw ConfigError("Plan '" + tier + "': '" + section + "' must be an object");
    }
    for (const auto& [kind, value] : obj.items()) {
        out[kind] = parse_limit(value, tier + "." + section + "." + kind);
    }
    return out;
}

PlanLimits make_plan(const std::string& tier, int64_t requests_per_minute,
                     int64_t ai_messages, int64_t api_calls,
                     int64_t client_spaces, int64_t external_users,
                     int64_t libraries, int64_t admins) {
    PlanLimits plan;
    plan.tier = tier;
    plan.rate.max_requests = requests_per_minute;
    plan.rate.window = std::chrono::minutes(1);
    plan.monthly_budgets = {
        {"ai-message", ai_messages},
        {"api-call", api_calls}
    };
    plan.static_resource_limits = {
        {"client-space", client_spaces},
        {"external-user", external_users},
        {"library", libraries},
        {"admin", admins}
    };
    return plan;
}

} // namespace

int64_t PlanLimits::monthly_budget(const std::string& budget_kind) const {
    auto it = monthly_budgets.find(budget_kind);
    return it == monthly_budgets.end() ? kUnlimited : it->second;
}

int64_t PlanLimits::resource_limit(const std::string& resource_kind) const {
    auto it = static_resource_limits.find(resource_kind);
    return it == static_resource_limits.end() ? kUnlimited : it->second;
}

PlanLimitResolver::PlanLimitResolver(std::vector<PlanLimits> plans) {
    for (auto& plan : plans) {
        if (plan.tier.empty()) {
            throw ConfigError("Plan with empty tier name");
        }
        if (plan.rate.window.count() <= 0) {
            throw ConfigError("Plan '" + plan.tier + "': rate window must be positive");
        }

        std::string key = util::to_lower(plan.tier);
        if (plans_.count(key)) {
            throw ConfigError("Duplicate plan tier: " + plan.tier);
        }
        plans_[key] = std::make_shared<const PlanLimits>(std::move(plan));
    }
}

PlanLimitResolver PlanLimitResolver::builtin() {
    return PlanLimitResolver({
        make_plan("Starter", 300, 20, 10000, 5, 50, 25, 2),
        make_plan("Professional", 1000, 1000, 50000, 20, 250, 100, 5),
        make_plan("Business", 2500, 5000, 250000, 100, 1000, 500, 15),
        make_plan("Enterprise", 5000, kUnlimited, kUnlimited,
                  kUnlimited, kUnlimited, kUnlimited, 999)
    });
}

PlanLimitResolver PlanLimitResolver::from_json(const nlohmann::json& doc) {
    if (!doc.contains("plans") || !doc["plans"].is_array()) {
        throw ConfigError("Plan configuration must contain a 'plans' array");
    }

    std::vector<PlanLimits> plans;
    for (const auto& entry : doc["plans"]) {
        PlanLimits plan;
        plan.tier = entry.value("tier", "");
        if (plan.tier.empty()) {
            throw ConfigError("Plan entry without 'tier'");
        }

        const auto rate = entry.value("rate", nlohmann::json::object());
        plan.rate.max_requests = parse_limit(rate.value("max_requests", nlohmann::json()),
                                             plan.tier + ".rate.max_requests");
        plan.rate.window = std::chrono::seconds(rate.value("window_seconds", 60));

        plan.monthly_budgets = parse_limit_map(
            entry.value("monthly_budgets", nlohmann::json()), plan.tier, "monthly_budgets");
        plan.static_resource_limits = parse_limit_map(
            entry.value("static_resource_limits", nlohmann::json()), plan.tier,
            "static_resource_limits");

        plans.push_back(std::move(plan));
    }

    return PlanLimitResolver(std::move(plans));
}

PlanLimitResolver PlanLimitResolver::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open plan configuration: " + path);
    }

    try {
        auto doc = nlohmann::json::parse(in);
        auto resolver = from_json(doc);
        spdlog::info("Loaded {} plan tiers from {}", resolver.plans_.size(), path);
        return resolver;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid plan configuration " + path + ": " + e.what());
    }
}

std::shared_ptr<const PlanLimits> PlanLimitResolver::resolve(const std::string& tier) const {
    auto it = plans_.find(util::to_lower(tier));
    if (it == plans_.end()) {
        throw ConfigError("No limits configured for plan tier '" + tier + "'");
    }
    return it->second;
}

bool PlanLimitResolver::has_tier(const std::string& tier) const {
    return plans_.count(util::to_lower(tier)) > 0;
}

void PlanLimitResolver::validate(const std::vector<std::string>& required_tiers) const {
    std::string missing;
    for (const auto& tier : required_tiers) {
        if (has_tier(tier)) continue;
        if (!missing.empty()) missing += ", ";
        missing += tier;
    }

    if (!missing.empty()) {
        throw ConfigError("Plan tiers without limits: " + missing);
    }

    spdlog::info("Plan limits validated for {} tier(s)", required_tiers.size());
}

void PlanLimitResolver::validate_resource_kinds(const std::vector<std::string>& countable_kinds) const {
    std::string missing;
    for (const auto& [_, plan] : plans_) {
        for (const auto& [kind, limit] : plan->static_resource_limits) {
            if (is_unlimited(limit)) continue;
            if (std::find(countable_kinds.begin(), countable_kinds.end(), kind) != countable_kinds.end()) {
                continue;
            }
            if (!missing.empty()) missing += ", ";
            missing += plan->tier + "." + kind;
        }
    }

    if (!missing.empty()) {
        throw ConfigError("Resource limits the store cannot count: " + missing);
    }
}
