/**
 * @file AuthorityResolver.cpp
 * @brief Implementation of AuthorityResolver.
 */

#include "domain/engine/AuthorityResolver.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include "domain/engine/TextUtils.hpp"

namespace tasksmind::domain::engine {

AuthorityResolver::AuthorityResolver(std::shared_ptr<const OrgHierarchyReader> hierarchy,
                                     std::shared_ptr<const AuthorityLookup> authorities,
                                     EngineConfig config)
    : m_hierarchy(std::move(hierarchy)), m_authorities(std::move(authorities)), m_config(std::move(config)) {
    if (!m_hierarchy || !m_authorities) {
        throw std::invalid_argument("AuthorityResolver requires a hierarchy reader and an authority lookup");
    }
}

std::vector<AuthoritySuggestion> AuthorityResolver::suggest(const TaskSnapshot& task) const {
    return suggest(task, m_config.authority.defaultLimit);
}

std::vector<AuthoritySuggestion> AuthorityResolver::suggest(const TaskSnapshot& task, size_t limit) const {
    if (limit == 0) {
        throw std::invalid_argument("Authority suggestion limit must be at least 1");
    }

    const std::vector<std::string> chain = ancestorChain(task.orgUnitId);

    std::vector<AuthoritySuggestion> suggestions;
    std::unordered_set<std::string> seen;
    for (size_t tier = 0; tier < chain.size(); ++tier) {
        const std::string& orgId = chain[tier];
        if (orgId.empty()) continue;

        const double confidence = confidenceForTier(tier);
        for (const auto& authority : authoritiesOf(orgId)) {
            if (!seen.insert(authority.id).second) continue;

            AuthoritySuggestion s;
            s.authorityId = authority.id;
            s.title = authority.title;
            s.orgUnitId = authority.orgUnitId;
            s.grade = authority.grade;
            s.confidence = confidence;
            s.rationale = "Authority aligned with org " + authority.orgUnitId + " (tier " + std::to_string(tier + 1) + ")";
            suggestions.push_back(std::move(s));

            if (suggestions.size() >= limit) return suggestions;
        }
    }

    if (suggestions.empty()) {
        const AuthorityConfig& a = m_config.authority;
        suggestions.push_back({a.fallbackId, a.fallbackTitle, task.orgUnitId, a.fallbackGrade,
                               Round2(a.confidenceFloor), a.fallbackRationale});
    }
    return suggestions;
}

std::vector<std::string> AuthorityResolver::ancestorChain(const std::string& orgUnitId) const {
    const size_t maxDepth = std::max<size_t>(m_config.authority.maxAncestorDepth, 1);

    std::vector<std::string> chain{orgUnitId};
    std::unordered_set<std::string> visited{orgUnitId};
    std::string current = orgUnitId;
    while (true) {
        auto parent = parentOf(current);
        if (!parent || parent->empty()) break;
        if (visited.count(*parent)) {
            std::cerr << "[AuthorityResolver] Cycle detected in org hierarchy at '" << *parent
                      << "'; stopping ancestor walk." << std::endl;
            break;
        }
        if (chain.size() >= maxDepth) {
            std::cerr << "[AuthorityResolver] Ancestor walk from '" << orgUnitId
                      << "' exceeded depth " << maxDepth << "; truncating." << std::endl;
            break;
        }
        chain.push_back(*parent);
        visited.insert(*parent);
        current = *parent;
    }
    return chain;
}

std::optional<std::string> AuthorityResolver::parentOf(const std::string& orgUnitId) const {
    if (orgUnitId.empty()) return std::nullopt;
    try {
        return m_hierarchy->getParent(orgUnitId);
    } catch (const std::exception& e) {
        std::cerr << "[AuthorityResolver] Parent lookup failed for '" << orgUnitId << "': " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<Authority> AuthorityResolver::authoritiesOf(const std::string& orgUnitId) const {
    try {
        return m_authorities->listByOrgUnit(orgUnitId);
    } catch (const std::exception& e) {
        std::cerr << "[AuthorityResolver] Authority lookup failed for '" << orgUnitId << "': " << e.what() << std::endl;
    }
    return {};
}

double AuthorityResolver::confidenceForTier(size_t tier) const {
    const AuthorityConfig& a = m_config.authority;
    return Round2(std::max(a.confidenceStart - a.confidenceStep * static_cast<double>(tier), a.confidenceFloor));
}

} // namespace tasksmind::domain::engine
