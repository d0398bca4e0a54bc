/**
 * @file classifier.cpp
 * @brief Classifier implementation.
 */

#include "classifier/classifier.hpp"

#include <algorithm>
#include <mutex>

namespace hybrid_router {

Classifier::Classifier(TierTableConfig tiers) : tiers_(std::move(tiers)) {}

void Classifier::load(const std::map<ToolName, Tier>& tools, Logger* logger) {
    for (const auto& [name, tier] : tools) {
        bool fresh = register_tool(name, tier);
        if (!fresh && logger) {
            logger->warn("classifier", "Tool '" + name + "' registered twice; keeping the later tier");
        }
    }
    if (logger) {
        logger->info("classifier", "Loaded " + std::to_string(tools.size()) + " tool descriptors");
    }
}

bool Classifier::register_tool(ToolDescriptor descriptor) {
    auto policy = this->policy(descriptor.tier);
    if (descriptor.local_timeout.count() == 0) descriptor.local_timeout = policy.local_timeout;
    if (descriptor.cache_ttl.count() == 0) descriptor.cache_ttl = policy.cache_ttl;

    std::unique_lock lock(mutex_);
    auto [it, inserted] = tools_.insert_or_assign(descriptor.name, std::move(descriptor));
    return inserted;
}

bool Classifier::register_tool(const ToolName& name, Tier tier,
                               std::vector<std::string> required_parameters) {
    return register_tool(ToolDescriptor{
        .name = name,
        .tier = tier,
        .required_parameters = std::move(required_parameters)
    });
}

std::optional<ToolDescriptor> Classifier::lookup(const ToolName& name) const {
    std::shared_lock lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) return std::nullopt;
    return it->second;
}

TierPolicy Classifier::policy(Tier tier) const {
    const auto& cfg = tiers_.for_tier(tier);
    return TierPolicy{
        .local_timeout = std::chrono::milliseconds{cfg.local_timeout_ms},
        .cache_ttl = std::chrono::seconds{cfg.cache_ttl_s},
        .priority = cfg.priority
    };
}

int32_t Classifier::priority_for(Tier tier) const {
    return tiers_.for_tier(tier).priority;
}

std::vector<ToolDescriptor> Classifier::tools() const {
    std::vector<ToolDescriptor> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(tools_.size());
        for (const auto& [name, desc] : tools_) out.push_back(desc);
    }
    std::sort(out.begin(), out.end(),
              [](const ToolDescriptor& a, const ToolDescriptor& b) { return a.name < b.name; });
    return out;
}

size_t Classifier::size() const {
    std::shared_lock lock(mutex_);
    return tools_.size();
}

}  // namespace hybrid_router
