/**
 * @file classifier.hpp
 * @brief Static registry of tool descriptors and per-tier routing policy.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hybrid_router {

/**
 * @brief Routing policy attached to a tier.
 */
struct TierPolicy {
    std::chrono::milliseconds local_timeout{0};   ///< 0 = no tier deadline
    std::chrono::seconds cache_ttl{0};
    int32_t priority{0};
};

/**
 * @brief Immutable description of a registered tool.
 */
struct ToolDescriptor {
    ToolName name;
    Tier tier{Tier::Medium};
    std::chrono::milliseconds local_timeout{0};
    std::chrono::seconds cache_ttl{0};
    std::vector<std::string> required_parameters;
    std::string description;
};

/**
 * @brief Maps tool names to descriptors.
 *
 * Lookups are pure and never guess: an unregistered name yields
 * std::nullopt, which the router turns into ErrorKind::UnknownTool.
 */
class Classifier {
public:
    explicit Classifier(TierTableConfig tiers = {});

    /// Registers the tools listed in the [tools] config table.
    void load(const std::map<ToolName, Tier>& tools, Logger* logger = nullptr);

    /**
     * @brief Registers a tool.
     *
     * Zero local_timeout / cache_ttl fields are filled from the tier policy.
     * Re-registering a name replaces the earlier descriptor; returns false
     * in that case.
     */
    bool register_tool(ToolDescriptor descriptor);

    /// Convenience overload using the tier defaults.
    bool register_tool(const ToolName& name, Tier tier,
                       std::vector<std::string> required_parameters = {});

    [[nodiscard]] std::optional<ToolDescriptor> lookup(const ToolName& name) const;
    [[nodiscard]] TierPolicy policy(Tier tier) const;
    [[nodiscard]] int32_t priority_for(Tier tier) const;
    [[nodiscard]] std::vector<ToolDescriptor> tools() const;
    [[nodiscard]] size_t size() const;

private:
    TierTableConfig tiers_;
    std::unordered_map<ToolName, ToolDescriptor> tools_;
    mutable std::shared_mutex mutex_;
};

}  // namespace hybrid_router
