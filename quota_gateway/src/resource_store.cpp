#include "resource_store.hpp"

void InMemoryResourceCounter::set_count(const std::string& tenant_id,
                                        const std::string& resource_kind, int64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[{tenant_id, resource_kind}] = count;
}

int64_t InMemoryResourceCounter::count_resources(const std::string& tenant_id,
                                                 const std::string& resource_kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find({tenant_id, resource_kind});
    return it == counts_.end() ? 0 : it->second;
}
