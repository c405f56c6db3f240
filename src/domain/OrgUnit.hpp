/**
 * @file OrgUnit.hpp
 * @brief Organizational hierarchy records.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tasksmind::domain {

/**
 * @struct OrgUnit
 * @brief A node in the organizational forest. No parent marks a root.
 */
struct OrgUnit {
    std::string id;
    std::string name;
    std::string echelon;
    std::optional<std::string> parentId;
};

/**
 * @struct Authority
 * @brief A position with approval power, owned by an organizational unit.
 */
struct Authority {
    std::string id;
    std::string title;
    std::string orgUnitId;
    std::string grade;
    std::vector<std::string> scope; ///< Policy-area keywords.
};

} // namespace tasksmind::domain
