#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_audit;

    // Postgres
    std::string pg_dsn;

    // Collaboration API
    std::string graph_base_url;
    std::string graph_access_token;
    int graph_timeout_ms;

    // Plans (empty: built-in catalog)
    std::string plan_config_path;

    // Retry policy
    int retry_max;
    int retry_base_delay_ms;
    int retry_max_delay_seconds;

    // Rate limiter housekeeping
    int rate_cleanup_interval_seconds;
    int rate_idle_hours;

    // HTTP server
    std::string listen_addr;
    int listen_port;
    int http_workers;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
