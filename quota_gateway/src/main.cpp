#include "config.hpp"
#include "clock.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "audit.hpp"
#include "plan_limits.hpp"
#include "rate_limiter.hpp"
#include "usage_budget.hpp"
#include "quota_gate.hpp"
#include "retry_executor.hpp"
#include "operation_runner.hpp"
#include "collaboration_client.hpp"
#include "health.hpp"
#include "api_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("quotaguard", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

PlanLimitResolver load_plans(const Config& config) {
    if (config.plan_config_path.empty()) {
        return PlanLimitResolver::builtin();
    }
    return PlanLimitResolver::from_file(config.plan_config_path);
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();

        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("QuotaGuard Gateway v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Storage
        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);
        pg->init_schema();

        auto redis = std::make_shared<RedisBus>(config.redis_url);

        // Plans must cover every tier with a live subscription
        auto plans = std::make_shared<const PlanLimitResolver>(load_plans(config));
        plans->validate(pg->active_plan_tiers());
        plans->validate_resource_kinds(PostgresStore::countable_resource_kinds());

        // Admission
        auto clock = std::make_shared<SystemClock>();
        auto rate_limiter = std::make_shared<LocalRateLimiter>(clock);
        auto budgets = std::make_shared<UsageBudgetTracker>(pg, clock);
        auto audit = std::make_shared<RedisAuditSink>(redis, config.stream_audit);
        auto gate = std::make_shared<QuotaGate>(plans, rate_limiter, budgets, pg, audit);

        // Upstream
        RetryPolicy policy;
        policy.max_retries = config.retry_max;
        policy.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
        policy.max_delay = std::chrono::seconds(config.retry_max_delay_seconds);
        auto retry = std::make_shared<RetryExecutor>(policy);

        ProtectedOperationRunner runner(gate, retry);
        CollaborationClient client(config.graph_base_url, config.graph_access_token,
                                   config.graph_timeout_ms);

        HealthCheck health(*redis, *pg, config);

        ApiServer server(config, runner,
            [&client](const std::string& method, const std::string& path,
                      const nlohmann::json& body) {
                return client.request(method, path, body);
            },
            &health);
        server.start();

        // Main loop
        const auto cleanup_interval = std::chrono::seconds(config.rate_cleanup_interval_seconds);
        const auto idle = std::chrono::hours(config.rate_idle_hours);
        auto last_cleanup = std::chrono::steady_clock::now();

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            if (!server.is_running()) {
                spdlog::error("HTTP server is no longer running, shutting down");
                break;
            }

            if (std::chrono::steady_clock::now() - last_cleanup >= cleanup_interval) {
                size_t removed = rate_limiter->cleanup_idle(idle);
                if (removed > 0) {
                    spdlog::debug("Dropped {} idle rate windows ({} tracked)",
                                  removed, rate_limiter->tenant_count());
                }
                last_cleanup = std::chrono::steady_clock::now();
            }
        }

        bool server_failed = !server.is_running();
        server.stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return server_failed ? 1 : 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
