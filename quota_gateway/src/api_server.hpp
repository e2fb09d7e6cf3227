#pragma once

#include "config.hpp"
#include "health.hpp"
#include "http_mapping.hpp"
#include "operation_runner.hpp"
#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

// Performs one call against the collaboration API; throws on failure.
using UpstreamCall = std::function<nlohmann::json(const std::string& method,
                                                  const std::string& path,
                                                  const nlohmann::json& body)>;

class ApiServer {
public:
    ApiServer(const Config& config,
              ProtectedOperationRunner& runner,
              UpstreamCall upstream,
              HealthCheck* health = nullptr);

    void start();
    void stop();
    bool is_running() const { return running_; }

    HttpReply process_operation(const std::string& body);
    HttpReply process_usage(const std::string& tenant_id, const std::string& plan_tier);
    HttpReply process_rate_limit_reset(const std::string& tenant_id);
    HttpReply process_health() const;

private:
    const Config& config_;
    ProtectedOperationRunner& runner_;
    UpstreamCall upstream_;
    HealthCheck* health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    static void write_reply(const HttpReply& reply, httplib::Response& res);
    static HttpReply error_reply(int status, const std::string& error, const std::string& message);
};
