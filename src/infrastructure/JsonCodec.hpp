/**
 * @file JsonCodec.hpp
 * @brief Maps domain value objects to and from their JSON wire form.
 *
 * Field names follow the public API (snake_case, e.g. "suspense_date",
 * "late_probability"). Decoders throw std::invalid_argument for missing or
 * malformed required fields; nlohmann::json type errors propagate as-is.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "application/TaskService.hpp"
#include "domain/Assignment.hpp"
#include "domain/Insights.hpp"
#include "domain/OrgUnit.hpp"
#include "domain/Task.hpp"

namespace tasksmind::infrastructure {

class JsonCodec {
public:
    static nlohmann::json ToJson(const domain::TaskSnapshot& task);
    static nlohmann::json ToJson(const application::TaskDetails& details);
    static nlohmann::json ToJson(const domain::AssignmentRecord& assignment);
    static nlohmann::json ToJson(const domain::Comment& comment);
    static nlohmann::json ToJson(const domain::AuthoritySuggestion& suggestion);
    static nlohmann::json ToJson(const domain::RiskInsight& insight);
    static nlohmann::json ToJson(const domain::QualityCheckResult& result);
    static nlohmann::json ToJson(const domain::TaskSummary& summary);
    static nlohmann::json ToJson(const domain::Authority& authority);

    /** @brief Decodes a task creation payload. */
    static domain::TaskSnapshot TaskFromJson(const nlohmann::json& j);

    /** @brief Decodes a partial update; absent keys stay disengaged. */
    static application::TaskPatch TaskPatchFromJson(const nlohmann::json& j);

    static domain::AssignmentRecord AssignmentFromJson(const nlohmann::json& j);
    static domain::Comment CommentFromJson(const nlohmann::json& j);
    static domain::OrgUnit OrgUnitFromJson(const nlohmann::json& j);
    static domain::Authority AuthorityFromJson(const nlohmann::json& j);

    /** @brief Parses "YYYY-MM-DD" or throws std::invalid_argument naming @p field. */
    static domain::Date DateFromString(const std::string& text, const std::string& field);
};

} // namespace tasksmind::infrastructure
