#include <catch2/catch_test_macros.hpp>
#include "../src/operation_runner.hpp"
#include "test_support.hpp"
#include <stdexcept>
#include <utility>

using namespace std::chrono_literals;

namespace {

class RecordingAuditSink : public AuditSink {
public:
    void emit_denial(const std::string& tenant_id, const QuotaDecision& decision) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.emplace_back(tenant_id, decision);
    }

    std::vector<std::pair<std::string, QuotaDecision>> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, QuotaDecision>> events_;
};

class FailingLedger : public UsageLedger {
public:
    void append(const UsageRecord&) override {
        throw std::runtime_error("ledger unavailable");
    }
    int64_t sum_since(const std::string&, const std::string&, int64_t) const override {
        return 0;
    }
};

PlanLimits small_plan() {
    PlanLimits plan;
    plan.tier = "Tiny";
    plan.rate.max_requests = 3;
    plan.rate.window = 60000ms;
    plan.monthly_budgets = {{"ai-message", 2}};
    plan.static_resource_limits = {{"client-space", 1}};
    return plan;
}

struct Harness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryUsageLedger> ledger = std::make_shared<InMemoryUsageLedger>();
    std::shared_ptr<InMemoryResourceCounter> resources = std::make_shared<InMemoryResourceCounter>();
    std::shared_ptr<LocalRateLimiter> limiter = std::make_shared<LocalRateLimiter>(clock);
    std::shared_ptr<RecordingAuditSink> audit = std::make_shared<RecordingAuditSink>();
    std::shared_ptr<RecordingSleeper> sleeper = std::make_shared<RecordingSleeper>();
    std::shared_ptr<QuotaGate> gate;
    std::shared_ptr<ProtectedOperationRunner> runner;

    explicit Harness(PlanLimitResolver plans = PlanLimitResolver::builtin(),
                     std::shared_ptr<UsageLedger> ledger_override = nullptr) {
        std::shared_ptr<UsageLedger> used_ledger = ledger_override ? ledger_override : ledger;
        auto budgets = std::make_shared<UsageBudgetTracker>(used_ledger, clock);
        gate = std::make_shared<QuotaGate>(
            std::make_shared<const PlanLimitResolver>(std::move(plans)),
            limiter, budgets, resources, audit);
        runner = std::make_shared<ProtectedOperationRunner>(
            gate, std::make_shared<RetryExecutor>(RetryPolicy{}, sleeper));
    }
};

} // namespace

TEST_CASE("Starter plan allows twenty assistant messages a month", "[runner]") {
    Harness h;
    int invoked = 0;
    auto send_message = [&] {
        invoked++;
        return std::string("reply");
    };

    for (int i = 0; i < 20; i++) {
        auto result = h.runner->execute("tenant-a", "Starter", "ai-message", send_message);
        REQUIRE(result.ok());
        REQUIRE(*result.value == "reply");
    }

    auto result = h.runner->execute("tenant-a", "Starter", "ai-message", send_message);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.kind == OperationErrorKind::UsageBudgetExceeded);
    REQUIRE(result.error.current == 20);
    REQUIRE(result.error.limit == 20);
    REQUIRE(result.error.plan_tier == "Starter");
    REQUIRE(result.error.is_denial());
    REQUIRE(result.error.user_message() ==
            "Monthly limit of 20 messages exceeded for Starter plan. Upgrade to continue.");

    REQUIRE(invoked == 20);
    REQUIRE(h.ledger->records().size() == 20);
}

TEST_CASE("Transient failures recover and charge once", "[runner]") {
    LogCapture logs;
    Harness h;

    int calls = 0;
    auto result = h.runner->execute("tenant-a", "Starter", "ai-message", [&] {
        calls++;
        if (calls <= 2) throw UpstreamError(503, "serviceNotAvailable", "unavailable");
        return 7;
    });

    REQUIRE(result.ok());
    REQUIRE(*result.value == 7);
    REQUIRE(calls == 3);

    auto retries = logs.lines_containing("retrying in");
    REQUIRE(retries.size() == 2);
    REQUIRE(retries[0].find("retrying in 2000ms") != std::string::npos);
    REQUIRE(retries[1].find("retrying in 4000ms") != std::string::npos);

    REQUIRE(h.ledger->records().size() == 1);
    REQUIRE(h.ledger->records()[0].amount == 1);
}

TEST_CASE("Failed operations are not charged", "[runner]") {
    Harness h;

    SECTION("Transient exhaustion") {
        int calls = 0;
        auto result = h.runner->execute("tenant-a", "Starter", "ai-message", [&]() -> int {
            calls++;
            throw UpstreamError(503, "", "unavailable");
        });

        REQUIRE_FALSE(result.ok());
        REQUIRE(calls == 4);
        REQUIRE(result.error.kind == OperationErrorKind::UpstreamFailed);
        REQUIRE(result.error.last_error_kind == ErrorKind::Transient);
        REQUIRE(result.error.attempts == 4);
        REQUIRE(result.error.upstream_status == 503);
        REQUIRE_FALSE(result.error.correlation_id.empty());
        REQUIRE_FALSE(result.error.is_denial());
    }

    SECTION("Permanent failure") {
        auto result = h.runner->execute("tenant-a", "Starter", "ai-message", []() -> int {
            throw UpstreamError(403, "accessDenied", "forbidden");
        });

        REQUIRE(result.error.kind == OperationErrorKind::UpstreamFailed);
        REQUIRE(result.error.last_error_kind == ErrorKind::Permanent);
        REQUIRE(result.error.attempts == 1);
        REQUIRE(result.error.upstream_code == "accessDenied");
    }

    REQUIRE(h.ledger->records().empty());
}

TEST_CASE("Denied operations never reach upstream", "[runner]") {
    Harness h(PlanLimitResolver({small_plan()}));
    int invoked = 0;
    auto op = [&] {
        invoked++;
        return true;
    };

    SECTION("Rate limited") {
        OperationRequest request;
        request.tenant_id = "tenant-a";
        request.plan_tier = "Tiny";
        request.operation = "list-files";

        for (int i = 0; i < 3; i++) {
            REQUIRE(h.runner->execute(request, op).ok());
        }
        h.clock->advance(15000ms);

        auto result = h.runner->execute(request, op);
        REQUIRE(result.error.kind == OperationErrorKind::RateLimited);
        REQUIRE(result.error.retry_after);
        REQUIRE(*result.error.retry_after == 45000ms);
        REQUIRE(result.error.limit == 3);
        REQUIRE(result.error.user_message() ==
                "Rate limit of 3 requests exceeded. Please try again in 45 seconds.");
        REQUIRE(invoked == 3);
        REQUIRE(h.ledger->records().empty());
    }

    SECTION("Static resource cap") {
        OperationRequest request;
        request.tenant_id = "tenant-a";
        request.plan_tier = "Tiny";
        request.operation = "create-client-space";
        request.resource_kind = "client-space";

        h.resources->set_count("tenant-a", "client-space", 1);

        auto result = h.runner->execute(request, op);
        REQUIRE(result.error.kind == OperationErrorKind::StaticLimitExceeded);
        REQUIRE(result.error.current == 1);
        REQUIRE(result.error.limit == 1);
        REQUIRE(result.error.resource_kind == "client-space");
        REQUIRE(result.error.user_message() ==
                "You have reached the maximum number of client spaces (1) for your Tiny plan. "
                "Upgrade your subscription to add more.");
        REQUIRE(invoked == 0);

        // Checked before the rate limiter, so no slot was used
        REQUIRE(h.limiter->status("tenant-a", small_plan().rate).request_count == 0);

        h.resources->set_count("tenant-a", "client-space", 0);
        REQUIRE(h.runner->execute(request, op).ok());
    }
}

TEST_CASE("Gate check order", "[gate]") {
    Harness h(PlanLimitResolver({small_plan()}));

    QuotaRequest request;
    request.tenant_id = "tenant-a";
    request.plan_tier = "tiny";
    request.budget_kind = "ai-message";

    SECTION("A budget denial still uses a rate slot") {
        h.ledger->append({"tenant-a", "ai-message", 2, "seed", h.clock->now_ms()});

        auto decision = h.gate->check(request);
        REQUIRE_FALSE(decision.allowed);
        REQUIRE(decision.reason == DenialReason::UsageBudgetExceeded);
        REQUIRE(decision.plan_tier == "Tiny");
        REQUIRE(h.limiter->status("tenant-a", small_plan().rate).request_count == 1);
    }

    SECTION("A static denial wins over an exhausted budget") {
        h.ledger->append({"tenant-a", "ai-message", 2, "seed", h.clock->now_ms()});
        h.resources->set_count("tenant-a", "client-space", 5);
        request.resource_kind = "client-space";

        auto decision = h.gate->check(request);
        REQUIRE(decision.reason == DenialReason::StaticLimitExceeded);
        REQUIRE(decision.current == 5);
    }

    SECTION("Empty budget kind skips the budget check") {
        h.ledger->append({"tenant-a", "ai-message", 2, "seed", h.clock->now_ms()});
        request.budget_kind.clear();

        auto decision = h.gate->check(request);
        REQUIRE(decision.allowed);
        REQUIRE(decision.reason == DenialReason::Ok);
    }

    SECTION("Unknown tier is a configuration error") {
        request.plan_tier = "Gold";
        REQUIRE_THROWS_AS(h.gate->check(request), ConfigError);
    }
}

TEST_CASE("Unlimited plans are never denied by budget", "[gate]") {
    Harness h;
    h.ledger->append({"tenant-a", "ai-message", 1000000, "seed", h.clock->now_ms()});
    h.resources->set_count("tenant-a", "client-space", 100000);

    QuotaRequest request;
    request.tenant_id = "tenant-a";
    request.plan_tier = "Enterprise";
    request.budget_kind = "ai-message";
    request.resource_kind = "client-space";

    REQUIRE(h.gate->check(request).allowed);
}

TEST_CASE("Each denial is audited once", "[gate]") {
    Harness h(PlanLimitResolver({small_plan()}));

    QuotaRequest request;
    request.tenant_id = "tenant-a";
    request.plan_tier = "Tiny";
    request.budget_kind = "ai-message";

    REQUIRE(h.gate->check(request).allowed);
    h.ledger->append({"tenant-a", "ai-message", 2, "seed", h.clock->now_ms()});
    REQUIRE_FALSE(h.gate->check(request).allowed);
    REQUIRE_FALSE(h.gate->check(request).allowed);
    REQUIRE_FALSE(h.gate->check(request).allowed);

    auto events = h.audit->events();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].first == "tenant-a");
    REQUIRE(events[0].second.reason == DenialReason::UsageBudgetExceeded);
    REQUIRE(events[1].second.reason == DenialReason::UsageBudgetExceeded);
    REQUIRE(events[2].second.reason == DenialReason::RateLimited);

    auto event = Auditor::build_denial_event(events[2].first, events[2].second);
    REQUIRE(event["event"] == "quota_denied");
    REQUIRE(event["reason"] == "RateLimited");
    REQUIRE(event["plan_tier"] == "Tiny");
    REQUIRE(event["retry_after_ms"] == 60000);
    REQUIRE_FALSE(event.contains("current"));

    auto budget_event = Auditor::build_denial_event(events[0].first, events[0].second);
    REQUIRE(budget_event["current"] == 2);
    REQUIRE(budget_event["limit"] == 2);
    REQUIRE(budget_event["budget_kind"] == "ai-message");
}

TEST_CASE("Ledger failures after success are logged only", "[runner]") {
    LogCapture logs;
    Harness h(PlanLimitResolver::builtin(), std::make_shared<FailingLedger>());

    auto result = h.runner->execute("tenant-a", "Starter", "ai-message", [] { return 1; });

    REQUIRE(result.ok());
    REQUIRE(logs.lines_containing("Failed to commit ai-message usage").size() == 1);
}

TEST_CASE("Operations without a budget kind are not charged", "[runner]") {
    Harness h;

    OperationRequest request;
    request.tenant_id = "tenant-a";
    request.plan_tier = "Starter";
    request.operation = "list-channels";

    REQUIRE(h.runner->execute(request, [] { return 0; }).ok());
    REQUIRE(h.ledger->records().empty());
}

TEST_CASE("Custom amounts are committed", "[runner]") {
    Harness h;

    OperationRequest request;
    request.tenant_id = "tenant-a";
    request.plan_tier = "Starter";
    request.operation = "bulk-import";
    request.budget_kind = "api-call";
    request.amount = 250;

    REQUIRE(h.runner->execute(request, [] { return 0; }).ok());

    auto records = h.ledger->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].amount == 250);
    REQUIRE(records[0].operation == "bulk-import");
}
