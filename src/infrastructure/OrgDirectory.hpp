/**
 * @file OrgDirectory.hpp
 * @brief In-memory organizational hierarchy and authority directory.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/OrgHierarchyReader.hpp"

namespace tasksmind::infrastructure {

/**
 * @class OrgDirectory
 * @brief Serves org units and authorities from memory.
 *
 * Implements both read interfaces used by the engine. Authorities are
 * listed in the order they were added.
 */
class OrgDirectory : public domain::OrgHierarchyReader, public domain::AuthorityLookup {
public:
    OrgDirectory() = default;

    /**
     * @brief Builds a directory from seed JSON with "org_units" and
     *        "authorities" arrays. Malformed entries are skipped with a warning.
     */
    static std::shared_ptr<OrgDirectory> FromJson(const nlohmann::json& seed);

    /**
     * @brief Loads seed JSON from disk.
     * @return An empty directory if the file is missing or unreadable.
     */
    static std::shared_ptr<OrgDirectory> LoadFromFile(const std::string& path);

    void addUnit(const domain::OrgUnit& unit);
    void addAuthority(const domain::Authority& authority);

    size_t unitCount() const;
    size_t authorityCount() const;

    std::optional<std::string> getParent(const std::string& orgUnitId) const override;
    std::optional<domain::OrgUnit> getUnit(const std::string& orgUnitId) const override;
    std::vector<domain::Authority> listByOrgUnit(const std::string& orgUnitId) const override;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, domain::OrgUnit> m_units;
    std::vector<domain::Authority> m_authorities;
};

} // namespace tasksmind::infrastructure
