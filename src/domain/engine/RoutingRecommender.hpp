/**
 * @file RoutingRecommender.hpp
 * @brief Recommends the organizational unit that should own a task.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/OrgHierarchyReader.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

/**
 * @struct RoutingDecision
 * @brief Recommended owning unit and a human-readable reason.
 */
struct RoutingDecision {
    std::string orgUnitId;
    std::string rationale;
};

/**
 * @class RoutingRecommender
 * @brief Keyword-driven routing with fallback to the originating unit.
 *
 * The hierarchy is consulted only to check that a candidate unit exists.
 * Never throws once constructed.
 */
class RoutingRecommender {
public:
    RoutingRecommender(std::shared_ptr<const OrgHierarchyReader> hierarchy, EngineConfig config = EngineConfig{});

    RoutingDecision recommend(const TaskSnapshot& task) const;

private:
    std::optional<OrgUnit> lookupUnit(const std::string& orgUnitId) const;

    std::shared_ptr<const OrgHierarchyReader> m_hierarchy;
    EngineConfig m_config;
};

} // namespace tasksmind::domain::engine
