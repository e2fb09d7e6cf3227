#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>

LocalRateLimiter::LocalRateLimiter(std::shared_ptr<const Clock> clock)
    : clock_(std::move(clock))
{}

LocalRateLimiter::Shard& LocalRateLimiter::shard_for(const std::string& tenant_id) {
    return shards_[std::hash<std::string>{}(tenant_id) % kShardCount];
}

const LocalRateLimiter::Shard& LocalRateLimiter::shard_for(const std::string& tenant_id) const {
    return shards_[std::hash<std::string>{}(tenant_id) % kShardCount];
}

std::shared_ptr<LocalRateLimiter::TenantWindow>
LocalRateLimiter::find_or_create(const std::string& tenant_id) {
    auto& shard = shard_for(tenant_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto& window = shard.tenants[tenant_id];
    if (!window) {
        window = std::make_shared<TenantWindow>();
        window->window_start_ms = clock_->now_ms();
    }
    return window;
}

std::shared_ptr<LocalRateLimiter::TenantWindow>
LocalRateLimiter::find(const std::string& tenant_id) const {
    const auto& shard = shard_for(tenant_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.tenants.find(tenant_id);
    return it == shard.tenants.end() ? nullptr : it->second;
}

RateDecision LocalRateLimiter::try_consume(const std::string& tenant_id, const RateLimit& limit) {
    for (;;) {
        auto window = find_or_create(tenant_id);

        std::lock_guard<std::mutex> lock(window->mutex);
        if (window->retired) continue;

        return consume_locked(tenant_id, *window, limit);
    }
}

RateDecision LocalRateLimiter::consume_locked(const std::string& tenant_id, TenantWindow& window,
                                              const RateLimit& limit) {
    int64_t now_ms = clock_->now_ms();
    int64_t window_ms = limit.window.count();
    window.window_ms = window_ms;

    if (now_ms - window.window_start_ms >= window_ms) {
        window.window_start_ms = now_ms;
        window.request_count = 0;
    }

    RateDecision decision;
    if (is_unlimited(limit.max_requests) || window.request_count < limit.max_requests) {
        window.request_count++;
        decision.allowed = true;
        return decision;
    }

    decision.retry_after = std::chrono::milliseconds(
        window.window_start_ms + window_ms - now_ms);

    spdlog::debug("Rate limit reached for tenant {}: {}/{} in window",
                  tenant_id, window.request_count, limit.max_requests);
    return decision;
}

RateWindowStatus LocalRateLimiter::status(const std::string& tenant_id, const RateLimit& limit) const {
    int64_t now_ms = clock_->now_ms();

    RateWindowStatus status;
    status.limit = limit.max_requests;
    status.window_start_ms = now_ms;

    if (auto window = find(tenant_id)) {
        std::lock_guard<std::mutex> lock(window->mutex);
        if (now_ms - window->window_start_ms < limit.window.count()) {
            status.request_count = window->request_count;
            status.window_start_ms = window->window_start_ms;
        }
    }

    status.reset_at_ms = status.window_start_ms + limit.window.count();
    status.remaining = is_unlimited(limit.max_requests)
        ? kUnlimited
        : std::max<int64_t>(0, limit.max_requests - status.request_count);
    return status;
}

void LocalRateLimiter::reset(const std::string& tenant_id) {
    auto& shard = shard_for(tenant_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.tenants.find(tenant_id);
    if (it != shard.tenants.end()) {
        std::lock_guard<std::mutex> window_lock(it->second->mutex);
        it->second->retired = true;
        shard.tenants.erase(it);
    }
    spdlog::info("Reset rate limit window for tenant {}", tenant_id);
}

size_t LocalRateLimiter::cleanup_idle(std::chrono::milliseconds max_idle) {
    int64_t now_ms = clock_->now_ms();
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.tenants.begin(); it != shard.tenants.end();) {
            bool idle;
            {
                auto& window = *it->second;
                std::lock_guard<std::mutex> window_lock(window.mutex);
                int64_t window_end_ms = window.window_start_ms + window.window_ms;
                idle = now_ms - window_end_ms >= max_idle.count();
                if (idle) window.retired = true;
            }
            if (idle) {
                it = shard.tenants.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        spdlog::debug("Dropped {} idle rate limit windows", removed);
    }
    return removed;
}

size_t LocalRateLimiter::tenant_count() const {
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        count += shard.tenants.size();
    }
    return count;
}
