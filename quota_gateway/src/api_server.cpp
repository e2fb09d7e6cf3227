#include "api_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

OperationRequest parse_operation_request(const nlohmann::json& doc) {
    OperationRequest request;
    request.tenant_id = doc.at("tenant_id").get<std::string>();
    request.plan_tier = doc.at("plan_tier").get<std::string>();
    request.operation = doc.value("operation", std::string());
    request.budget_kind = doc.value("budget_kind", std::string());
    request.resource_kind = doc.value("resource_kind", std::string());
    request.amount = doc.value("amount", static_cast<int64_t>(1));

    if (request.tenant_id.empty()) {
        throw std::invalid_argument("tenant_id must not be empty");
    }
    if (request.plan_tier.empty()) {
        throw std::invalid_argument("plan_tier must not be empty");
    }
    if (request.amount < 0) {
        throw std::invalid_argument("amount must not be negative");
    }
    return request;
}

} // namespace

ApiServer::ApiServer(const Config& config,
                     ProtectedOperationRunner& runner,
                     UpstreamCall upstream,
                     HealthCheck* health)
    : config_(config)
    , runner_(runner)
    , upstream_(std::move(upstream))
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{} ({} workers)",
                     config_.listen_addr, config_.listen_port, config_.http_workers);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
        running_ = false;
    });

    spdlog::info("API server started");
}

void ApiServer::stop() {
    server_->stop();
    running_ = false;

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("API server stopped");
}

void ApiServer::setup_routes() {
    size_t workers = static_cast<size_t>(config_.http_workers);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server_->Get("/health",
        [this](const httplib::Request&, httplib::Response& res) {
            write_reply(process_health(), res);
        });

    server_->Post("/v1/operations",
        [this](const httplib::Request& req, httplib::Response& res) {
            write_reply(process_operation(req.body), res);
        });

    server_->Get(R"(/v1/tenants/([^/]+)/usage)",
        [this](const httplib::Request& req, httplib::Response& res) {
            std::string plan = req.has_param("plan") ? req.get_param_value("plan") : "";
            write_reply(process_usage(req.matches[1], plan), res);
        });

    server_->Post(R"(/v1/tenants/([^/]+)/rate-limit/reset)",
        [this](const httplib::Request& req, httplib::Response& res) {
            write_reply(process_rate_limit_reset(req.matches[1]), res);
        });
}

HttpReply ApiServer::process_operation(const std::string& body) {
    try {
        auto doc = nlohmann::json::parse(body);
        OperationRequest request = parse_operation_request(doc);

        const auto& call = doc.at("request");
        std::string method = call.at("method").get<std::string>();
        std::string path = call.at("path").get<std::string>();
        nlohmann::json payload = call.value("body", nlohmann::json());

        auto result = runner_.execute(request, [&]() {
            return upstream_(method, path, payload);
        });

        HttpReply reply;
        if (result.ok()) {
            reply.body = {{"ok", true}, {"result", *result.value}};
        } else {
            reply = to_http_reply(result.error);
        }

        auto plan = runner_.gate().plans().resolve(request.plan_tier);
        add_rate_limit_headers(reply,
            runner_.gate().rate_limiter().status(request.tenant_id, plan->rate));
        return reply;

    } catch (const ConfigError& e) {
        spdlog::error("Plan configuration error: {}", e.what());
        return error_reply(500, "ConfigurationError", "Plan configuration is invalid");
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Rejected malformed operation request: {}", e.what());
        return error_reply(400, "BadRequest", "Malformed operation request");
    } catch (const std::invalid_argument& e) {
        return error_reply(400, "BadRequest", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Operation handler error: {}", e.what());
        return error_reply(500, "InternalError", "Internal error");
    }
}

HttpReply ApiServer::process_usage(const std::string& tenant_id, const std::string& plan_tier) {
    if (plan_tier.empty()) {
        return error_reply(400, "BadRequest", "Query parameter 'plan' is required");
    }

    try {
        auto& gate = runner_.gate();
        auto plan = gate.plans().resolve(plan_tier);

        nlohmann::json budgets = nlohmann::json::array();
        for (const auto& [kind, limit] : plan->monthly_budgets) {
            auto snap = gate.budgets().snapshot(tenant_id, kind, limit);
            budgets.push_back({
                {"budgetKind", snap.budget_kind},
                {"current", snap.current},
                {"limit", snap.limit},
                {"percentUsed", snap.percent_used},
                {"monthStart", util::iso8601_from_ms(snap.month_start_ms)}
            });
        }

        auto window = gate.rate_limiter().status(tenant_id, plan->rate);

        HttpReply reply;
        reply.body = {
            {"tenantId", tenant_id},
            {"planTier", plan->tier},
            {"budgets", budgets},
            {"rate", {
                {"requestCount", window.request_count},
                {"limit", window.limit},
                {"remaining", window.remaining},
                {"windowStart", util::iso8601_from_ms(window.window_start_ms)},
                {"resetAt", util::iso8601_from_ms(window.reset_at_ms)}
            }}
        };
        add_rate_limit_headers(reply, window);
        return reply;

    } catch (const ConfigError& e) {
        spdlog::error("Plan configuration error: {}", e.what());
        return error_reply(500, "ConfigurationError", "Plan configuration is invalid");
    } catch (const std::exception& e) {
        spdlog::error("Usage handler error for tenant {}: {}", tenant_id, e.what());
        return error_reply(500, "InternalError", "Internal error");
    }
}

HttpReply ApiServer::process_rate_limit_reset(const std::string& tenant_id) {
    runner_.gate().rate_limiter().reset(tenant_id);

    HttpReply reply;
    reply.body = {{"ok", true}, {"tenantId", tenant_id}};
    return reply;
}

HttpReply ApiServer::process_health() const {
    HttpReply reply;
    if (!health_) {
        reply.body = {{"ok", true}, {"service", config_.service_name}};
        return reply;
    }

    reply.body = health_->get_status();
    reply.status = reply.body.value("ok", false) ? 200 : 503;
    return reply;
}

void ApiServer::write_reply(const HttpReply& reply, httplib::Response& res) {
    for (const auto& [name, value] : reply.headers) {
        res.set_header(name, value);
    }
    res.set_content(reply.body.dump(), "application/json");
    res.status = reply.status;
}

HttpReply ApiServer::error_reply(int status, const std::string& error, const std::string& message) {
    HttpReply reply;
    reply.status = status;
    reply.body = {{"error", error}, {"message", message}};
    return reply;
}
