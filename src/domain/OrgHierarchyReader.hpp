/**
 * @file OrgHierarchyReader.hpp
 * @brief Read-only interfaces onto organizational and authority data.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/OrgUnit.hpp"

namespace tasksmind::domain {

/**
 * @class OrgHierarchyReader
 * @brief Abstract read access to the organizational hierarchy.
 */
class OrgHierarchyReader {
public:
    virtual ~OrgHierarchyReader() = default;

    /**
     * @brief Returns the parent of a unit.
     * @return Parent id, or nullopt at a root or for an unknown unit.
     */
    virtual std::optional<std::string> getParent(const std::string& orgUnitId) const = 0;

    /** @brief Returns the unit record, or nullopt if it does not exist. */
    virtual std::optional<OrgUnit> getUnit(const std::string& orgUnitId) const = 0;
};

/**
 * @class AuthorityLookup
 * @brief Abstract read access to authority records.
 */
class AuthorityLookup {
public:
    virtual ~AuthorityLookup() = default;

    /** @brief All authorities owned by a unit, in stable listing order. */
    virtual std::vector<Authority> listByOrgUnit(const std::string& orgUnitId) const = 0;
};

} // namespace tasksmind::domain
