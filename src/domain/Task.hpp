/**
 * @file Task.hpp
 * @brief Domain entity representing a tracked task.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Date.hpp"
#include "domain/TaskStatus.hpp"

namespace tasksmind::domain {

/**
 * @struct TaskSnapshot
 * @brief Immutable view of a task handed to the prioritization engine.
 *
 * The engine never mutates a snapshot; it returns derived values that the
 * caller may stamp back onto its own copy.
 */
struct TaskSnapshot {
    std::string id;
    std::string title;
    std::string description;
    std::vector<std::string> tags; ///< Keyword tags, order preserved.
    Classification classification = Classification::Unclassified;
    Date suspenseDate;             ///< Deadline.
    std::string originator;        ///< Free-text requesting entity.
    std::string orgUnitId;
    TaskStatus status = TaskStatus::Draft;
    std::optional<std::string> recordSeriesId; ///< ARIMS record series.
    std::optional<double> priorityScore;       ///< Set once the task has been scored.
};

} // namespace tasksmind::domain
