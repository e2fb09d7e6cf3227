#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/plan_limits.hpp"
#include <cstdio>
#include <fstream>

using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

TEST_CASE("Built-in plan catalog", "[plans]") {
    auto plans = PlanLimitResolver::builtin();

    SECTION("Starter") {
        auto starter = plans.resolve("Starter");
        REQUIRE(starter->tier == "Starter");
        REQUIRE(starter->rate.max_requests == 300);
        REQUIRE(starter->rate.window == 60000ms);
        REQUIRE(starter->monthly_budget("ai-message") == 20);
        REQUIRE(starter->monthly_budget("api-call") == 10000);
        REQUIRE(starter->resource_limit("client-space") == 5);
        REQUIRE(starter->resource_limit("external-user") == 50);
        REQUIRE(starter->resource_limit("library") == 25);
        REQUIRE(starter->resource_limit("admin") == 2);
    }

    SECTION("Professional and Business") {
        REQUIRE(plans.resolve("Professional")->monthly_budget("ai-message") == 1000);
        REQUIRE(plans.resolve("Professional")->rate.max_requests == 1000);
        REQUIRE(plans.resolve("Business")->monthly_budget("ai-message") == 5000);
        REQUIRE(plans.resolve("Business")->resource_limit("client-space") == 100);
    }

    SECTION("Enterprise is unlimited except admins") {
        auto enterprise = plans.resolve("Enterprise");
        REQUIRE(is_unlimited(enterprise->monthly_budget("ai-message")));
        REQUIRE(is_unlimited(enterprise->resource_limit("client-space")));
        REQUIRE(enterprise->resource_limit("admin") == 999);
    }

    SECTION("Kinds missing from a plan are unlimited") {
        auto starter = plans.resolve("Starter");
        REQUIRE(is_unlimited(starter->monthly_budget("video-minute")));
        REQUIRE(is_unlimited(starter->resource_limit("dashboard")));
    }

    for (const char* tier : {"Starter", "Professional", "Business", "Enterprise"}) {
        REQUIRE(plans.has_tier(tier));
    }
}

TEST_CASE("Tier lookup", "[plans]") {
    auto plans = PlanLimitResolver::builtin();

    SECTION("Case-insensitive") {
        REQUIRE(plans.resolve("starter") == plans.resolve("STARTER"));
        REQUIRE(plans.has_tier("business"));
    }

    SECTION("Unknown tier is a configuration error") {
        REQUIRE_FALSE(plans.has_tier("Gold"));
        REQUIRE_THROWS_AS(plans.resolve("Gold"), ConfigError);
    }

    SECTION("Startup validation names missing tiers") {
        std::vector<std::string> covered = {"Starter", "enterprise"};
        std::vector<std::string> uncovered = {"Starter", "Gold", "Trial"};

        REQUIRE_NOTHROW(plans.validate(covered));
        REQUIRE_THROWS_WITH(plans.validate(uncovered),
                            ContainsSubstring("Gold") && ContainsSubstring("Trial"));
    }
}

TEST_CASE("Resource kinds must be countable", "[plans]") {
    std::vector<std::string> countable = {"client-space", "external-user", "library", "admin"};

    SECTION("Built-in catalog only caps countable kinds") {
        REQUIRE_NOTHROW(PlanLimitResolver::builtin().validate_resource_kinds(countable));
    }

    SECTION("An uncountable kind is named with its tier") {
        auto plans = PlanLimitResolver::from_json(nlohmann::json::parse(R"({
            "plans": [{"tier": "Team", "static_resource_limits": {"site": 3, "admin": 2}}]
        })"));
        REQUIRE_THROWS_WITH(plans.validate_resource_kinds(countable),
                            ContainsSubstring("Team.site") && !ContainsSubstring("admin"));
    }

    SECTION("Unlimited kinds need no count") {
        auto plans = PlanLimitResolver::from_json(nlohmann::json::parse(R"({
            "plans": [{"tier": "Team", "static_resource_limits": {"site": -1, "seat": null}}]
        })"));
        REQUIRE_NOTHROW(plans.validate_resource_kinds(countable));
    }
}

TEST_CASE("Plan configuration from JSON", "[plans]") {
    SECTION("Null and -1 mean unlimited") {
        auto doc = nlohmann::json::parse(R"({
            "plans": [
                {
                    "tier": "Team",
                    "rate": {"max_requests": 50, "window_seconds": 10},
                    "monthly_budgets": {"ai-message": 100, "api-call": null},
                    "static_resource_limits": {"client-space": -1, "admin": 3}
                }
            ]
        })");

        auto plans = PlanLimitResolver::from_json(doc);
        auto team = plans.resolve("team");
        REQUIRE(team->rate.max_requests == 50);
        REQUIRE(team->rate.window == 10000ms);
        REQUIRE(team->monthly_budget("ai-message") == 100);
        REQUIRE(is_unlimited(team->monthly_budget("api-call")));
        REQUIRE(is_unlimited(team->resource_limit("client-space")));
        REQUIRE(team->resource_limit("admin") == 3);
    }

    SECTION("Missing rate means unlimited requests per minute") {
        auto plans = PlanLimitResolver::from_json(
            nlohmann::json::parse(R"({"plans": [{"tier": "Free"}]})"));
        auto free = plans.resolve("Free");
        REQUIRE(is_unlimited(free->rate.max_requests));
        REQUIRE(free->rate.window == 60000ms);
    }

    SECTION("Invalid documents are rejected") {
        REQUIRE_THROWS_AS(PlanLimitResolver::from_json(nlohmann::json::object()), ConfigError);
        REQUIRE_THROWS_AS(PlanLimitResolver::from_json(
            nlohmann::json::parse(R"({"plans": [{"rate": {"max_requests": 5}}]})")), ConfigError);
        REQUIRE_THROWS_AS(PlanLimitResolver::from_json(
            nlohmann::json::parse(R"({"plans": [{"tier": "A", "monthly_budgets": {"x": 0}}]})")),
            ConfigError);
        REQUIRE_THROWS_AS(PlanLimitResolver::from_json(
            nlohmann::json::parse(R"({"plans": [{"tier": "A"}, {"tier": "a"}]})")), ConfigError);
        REQUIRE_THROWS_AS(PlanLimitResolver::from_json(
            nlohmann::json::parse(R"({"plans": [{"tier": "A", "rate": {"window_seconds": 0}}]})")),
            ConfigError);
    }
}

TEST_CASE("Plan configuration from file", "[plans]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(PlanLimitResolver::from_file("/nonexistent/plans.json"), ConfigError);
    }

    SECTION("Round trip through disk") {
        std::string path = "quotaguard_test_plans.json";
        {
            std::ofstream out(path);
            out << R"({"plans": [{"tier": "Solo", "rate": {"max_requests": 5}}]})";
        }
        auto plans = PlanLimitResolver::from_file(path);
        std::remove(path.c_str());

        REQUIRE(plans.resolve("solo")->rate.max_requests == 5);
    }

    SECTION("Malformed JSON") {
        std::string path = "quotaguard_bad_plans.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(PlanLimitResolver::from_file(path), ConfigError);
        std::remove(path.c_str());
    }
}
