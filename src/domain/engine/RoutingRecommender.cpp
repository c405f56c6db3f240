/**
 * @file RoutingRecommender.cpp
 * @brief Implementation of RoutingRecommender.
 */

#include "domain/engine/RoutingRecommender.hpp"
#include <iostream>
#include <stdexcept>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

RoutingRecommender::RoutingRecommender(std::shared_ptr<const OrgHierarchyReader> hierarchy, EngineConfig config)
    : m_hierarchy(std::move(hierarchy)), m_config(std::move(config)) {
    if (!m_hierarchy) {
        throw std::invalid_argument("RoutingRecommender requires a hierarchy reader");
    }
}

RoutingDecision RoutingRecommender::recommend(const TaskSnapshot& task) const {
    std::vector<std::string> parts = task.tags;
    parts.push_back(task.title);
    parts.push_back(task.description);
    const std::string text = JoinNormalized(parts);

    for (const auto& route : m_config.keywordRoutes) {
        const std::string keyword = Normalize(route.keyword);
        if (keyword.empty() || text.find(keyword) == std::string::npos) continue;

        // A keyword whose section is not in the hierarchy does not stop the scan.
        if (auto unit = lookupUnit(route.orgUnitId)) {
            return {unit->id, "Matched keyword '" + route.keyword + "' with org " + unit->name};
        }
    }

    if (auto origin = lookupUnit(task.orgUnitId)) {
        return {origin->id, "Defaulted to originating org"};
    }
    return {task.orgUnitId, "No org metadata available; used provided org_unit_id"};
}

std::optional<OrgUnit> RoutingRecommender::lookupUnit(const std::string& orgUnitId) const {
    if (orgUnitId.empty()) return std::nullopt;
    try {
        return m_hierarchy->getUnit(orgUnitId);
    } catch (const std::exception& e) {
        std::cerr << "[RoutingRecommender] Hierarchy lookup failed for '" << orgUnitId << "': " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace tasksmind::domain::engine
