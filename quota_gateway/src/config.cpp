#include "config.hpp"
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_audit = get_env("STREAM_AUDIT", "quota.audit");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.graph_base_url = get_env("GRAPH_BASE_URL", "https://graph.microsoft.com/v1.0");
    cfg.graph_access_token = get_env("GRAPH_ACCESS_TOKEN");
    cfg.graph_timeout_ms = get_env_int("GRAPH_TIMEOUT_MS", 30000);

    cfg.plan_config_path = get_env("PLAN_CONFIG_PATH");

    cfg.retry_max = get_env_int("RETRY_MAX", 3);
    cfg.retry_base_delay_ms = get_env_int("RETRY_BASE_DELAY_MS", 1000);
    cfg.retry_max_delay_seconds = get_env_int("RETRY_MAX_DELAY_SECONDS", 30);

    cfg.rate_cleanup_interval_seconds = get_env_int("RATE_CLEANUP_INTERVAL_SECONDS", 300);
    cfg.rate_idle_hours = get_env_int("RATE_IDLE_HOURS", 2);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    cfg.http_workers = get_env_int("HTTP_WORKERS", 16);

    cfg.service_name = get_env("SERVICE_NAME", "quota_gateway");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (graph_base_url.empty()) {
        throw std::runtime_error("GRAPH_BASE_URL is required");
    }
    if (retry_max < 0 || retry_base_delay_ms <= 0 || retry_max_delay_seconds <= 0) {
        throw std::runtime_error("Retry settings must be positive");
    }
    if (http_workers <= 0) {
        throw std::runtime_error("HTTP_WORKERS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Retry: max={}, base={}ms, cap={}s",
                 retry_max, retry_base_delay_ms, retry_max_delay_seconds);
    spdlog::info("  Plans: {}", plan_config_path.empty() ? "built-in" : plan_config_path);
}
