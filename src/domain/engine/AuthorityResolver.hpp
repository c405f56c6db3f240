/**
 * @file AuthorityResolver.hpp
 * @brief Ranks approving authorities by walking the organizational ancestry.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/Insights.hpp"
#include "domain/OrgHierarchyReader.hpp"
#include "domain/Task.hpp"
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::domain::engine {

/**
 * @class AuthorityResolver
 * @brief Suggests approving authorities with confidence decaying per tier.
 *
 * Tier 0 is the task's own unit, tier 1 its parent, and so on. Closer tiers
 * take priority; within a tier the lookup's listing order is kept. The
 * result is never empty: when no authority is found a single fallback
 * suggestion is returned.
 */
class AuthorityResolver {
public:
    AuthorityResolver(std::shared_ptr<const OrgHierarchyReader> hierarchy,
                      std::shared_ptr<const AuthorityLookup> authorities,
                      EngineConfig config = EngineConfig{});

    /** @brief Suggests up to the configured default number of authorities. */
    std::vector<AuthoritySuggestion> suggest(const TaskSnapshot& task) const;

    /**
     * @brief Suggests up to @p limit authorities.
     * @throws std::invalid_argument if limit is zero.
     */
    std::vector<AuthoritySuggestion> suggest(const TaskSnapshot& task, size_t limit) const;

    /**
     * @brief The unit followed by its ancestors, nearest first.
     *
     * Stops at a root, at a unit already visited, or at the configured
     * maximum depth.
     */
    std::vector<std::string> ancestorChain(const std::string& orgUnitId) const;

private:
    std::optional<std::string> parentOf(const std::string& orgUnitId) const;
    std::vector<Authority> authoritiesOf(const std::string& orgUnitId) const;
    double confidenceForTier(size_t tier) const;

    std::shared_ptr<const OrgHierarchyReader> m_hierarchy;
    std::shared_ptr<const AuthorityLookup> m_authorities;
    EngineConfig m_config;
};

} // namespace tasksmind::domain::engine
